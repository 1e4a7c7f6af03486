#include <DocxFill/Docx.hpp>
#include <DocxFill/Variables.hpp>
#include <DocxFill/Builder.hpp>
#include <QImage>
#include <iostream>

// Fills a loan summary template: {{BORROWER_NAME}}, {{LOAN_AMOUNT}} in the body and an {{IMAGE_SITE_PLAN}} paragraph.

using namespace DocxFill;

int main(){
    Docx doc("loan_template.docx");
    std::cout << "placeholders:";
    for(const auto &t : doc.findVariables()) std::cout << ' ' << t.toStdString();
    std::cout << std::endl;

    Variables vars;
    vars.addText("BORROWER_NAME", "Acme Holdings LLC");
    vars.add(makeTextVar("LOAN_AMOUNT", "$12,500,000"));
    QImage plan(800, 600, QImage::Format_RGB32);
    plan.fill(Qt::darkGreen);
    if(auto img = makeImageVar("IMAGE_SITE_PLAN", plan)) vars.add(img);

    if(!doc.fillTemplate(vars)) {
        std::cerr << "fill failed: " << doc.lastErrorMessage().toStdString() << std::endl;
        return 1;
    }
    for(const auto &t : doc.unresolvedVariables()) std::cout << "left literal: " << t.toStdString() << std::endl;
    if(!doc.save("loan_output.docx")) {
        std::cerr << "save failed: " << doc.lastErrorMessage().toStdString() << std::endl;
        return 1;
    }
    std::cout << "fill_workflow example complete" << std::endl;
    return 0;
}
