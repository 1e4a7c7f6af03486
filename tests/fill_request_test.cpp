// JSON fill request parsing.
#include "DocxFill/FillRequest.hpp"
#include "DocxFill/ImageVariable.hpp"
#include "DocxFill/TextVariable.hpp"
#include <cassert>
#include <iostream>

using namespace DocxFill;

int main(){
    // Full request, scalar conversion, output key fallback
    {
        QString err;
        auto req = FillRequest::fromJson(R"({
            "placeholders": {"LOAN_AMOUNT": "$25,650,000", "UNITS": 120, "RATE": 6.25, "RECOURSE": false, "NOTE": null},
            "images": {"IMAGE_SITE_PLAN": "iVBORw0KGgo="},
            "template_key": "templates/IDS_Template.docx",
            "output_key": "out/loan.docx"
        })", &err);
        assert(req.has_value() && err.isEmpty());
        assert(req->placeholders.value("LOAN_AMOUNT") == "$25,650,000");
        assert(req->placeholders.value("UNITS") == "120");
        assert(req->placeholders.value("RATE") == "6.25");
        assert(req->placeholders.value("RECOURSE") == "false");
        assert(req->placeholders.contains("NOTE") && req->placeholders.value("NOTE").isEmpty());
        assert(req->images.value("IMAGE_SITE_PLAN") == "iVBORw0KGgo=");
        assert(req->templatePath == "templates/IDS_Template.docx");
        assert(req->outputPath == "out/loan.docx");
        Variables vars = req->toVariables();
        assert(vars.all().size() == 6);
        int images = 0;
        for(const auto &v : vars.all()) if(v->type() == VariableType::Image) ++images;
        assert(images == 1);
    }
    // Numbers beyond the exact integer range keep their magnitude instead of wrapping.
    {
        auto req = FillRequest::fromJson(R"({"placeholders": {"HUGE": 1e20, "NEG": -3, "MAX": 1e300, "HALF": -2.5, "EDGE": 9007199254740991}})");
        assert(req.has_value());
        assert(req->placeholders.value("HUGE") == "1e+20");
        assert(req->placeholders.value("NEG") == "-3");
        assert(req->placeholders.value("MAX") == "1e+300");
        assert(req->placeholders.value("HALF") == "-2.5");
        assert(req->placeholders.value("EDGE") == "9007199254740991");
    }
    // Defaults and output_filename precedence
    {
        auto req = FillRequest::fromJson("{}");
        assert(req.has_value() && req->placeholders.isEmpty() && req->images.isEmpty());
        assert(req->outputPath == "IDS_Generated.docx" && req->templatePath.isEmpty());
        req = FillRequest::fromJson(R"({"output_filename": "a.docx", "output_key": "b.docx"})");
        assert(req->outputPath == "a.docx");
    }
    // Malformed requests
    {
        QString err;
        assert(!FillRequest::fromJson("{not json", &err).has_value() && !err.isEmpty());
        assert(!FillRequest::fromJson("[1, 2]", &err).has_value());
        assert(!FillRequest::fromJson(R"({"placeholders": [1]})", &err).has_value() && err.contains("placeholders"));
        assert(!FillRequest::fromJson(R"({"placeholders": {"A": {"nested": 1}}})", &err).has_value() && err.contains("A"));
        assert(!FillRequest::fromJson(R"({"images": {"IMAGE_X": 5}})", &err).has_value() && err.contains("IMAGE_X"));
    }
    std::cout << "fill_request_test passed" << std::endl; return 0;
}
