#include "engine/Replacers.hpp"
#include "xml/XmlPart.hpp"
#include <string>

namespace DocxFill { namespace engine {

void Replacers::replaceText(FormattedContainer &container, const Span &span, const QString &value) {
	auto &runs = container.runs;
	if(span.startRun < 0 || span.endRun >= static_cast<int>(runs.size()) || span.startRun > span.endRun) return;
	const Run &first = runs[span.startRun];
	const Run &last = runs[span.endRun];

	Run prefix = first;
	prefix.text = first.text.left(span.startOffset);
	Run suffix = last;
	suffix.text = last.text.mid(span.endOffset);
	Run inserted = first;
	inserted.text = value;

	std::vector<Run> out;
	out.reserve(runs.size() + 2);
	for(int i = 0; i < span.startRun; ++i) out.push_back(runs[i]);
	if(!prefix.text.isEmpty()) out.push_back(std::move(prefix));
	out.push_back(std::move(inserted));
	if(!suffix.text.isEmpty()) out.push_back(std::move(suffix));
	for(int i = span.endRun + 1; i < static_cast<int>(runs.size()); ++i) out.push_back(runs[i]);
	runs = std::move(out);
}

bool Replacers::injectImage(FormattedContainer &container, const Span &span, const PictureRef &picture) {
	if(span.startRun < 0 || span.startRun >= static_cast<int>(container.runs.size())) return false;
	auto run = RunModel::makePayloadRun(container.runs[span.startRun], buildDrawingXml(picture));
	if(!run) return false;
	container.runs.clear();
	container.runs.push_back(std::move(*run));
	return true;
}

QByteArray Replacers::buildDrawingXml(const PictureRef &picture) {
	const std::string cx = std::to_string(picture.cx), cy = std::to_string(picture.cy);
	const std::string docPrId = std::to_string(picture.docPrId);
	const QByteArray name = picture.name.toUtf8(), descr = picture.description.toUtf8(), rId = picture.relationshipId.toUtf8();

	pugi::xml_document doc;
	pugi::xml_node drawing = doc.append_child("w:drawing");
	pugi::xml_node inlineNode = drawing.append_child("wp:inline");
	inlineNode.append_attribute("distT") = "0"; inlineNode.append_attribute("distB") = "0";
	inlineNode.append_attribute("distL") = "0"; inlineNode.append_attribute("distR") = "0";
	inlineNode.append_attribute("xmlns:wp") = "http://schemas.openxmlformats.org/drawingml/2006/wordprocessingDrawing";
	inlineNode.append_attribute("xmlns:a") = "http://schemas.openxmlformats.org/drawingml/2006/main";
	inlineNode.append_attribute("xmlns:pic") = "http://schemas.openxmlformats.org/drawingml/2006/picture";
	inlineNode.append_attribute("xmlns:r") = "http://schemas.openxmlformats.org/officeDocument/2006/relationships";
	auto extent = inlineNode.append_child("wp:extent"); extent.append_attribute("cx") = cx.c_str(); extent.append_attribute("cy") = cy.c_str();
	auto effect = inlineNode.append_child("wp:effectExtent");
	effect.append_attribute("l") = "0"; effect.append_attribute("t") = "0"; effect.append_attribute("r") = "0"; effect.append_attribute("b") = "0";
	auto docPr = inlineNode.append_child("wp:docPr");
	docPr.append_attribute("id") = docPrId.c_str();
	docPr.append_attribute("name") = name.constData();
	if(!descr.isEmpty()) docPr.append_attribute("descr") = descr.constData();
	inlineNode.append_child("wp:cNvGraphicFramePr").append_child("a:graphicFrameLocks").append_attribute("noChangeAspect") = "1";
	auto graphic = inlineNode.append_child("a:graphic");
	auto gData = graphic.append_child("a:graphicData"); gData.append_attribute("uri") = "http://schemas.openxmlformats.org/drawingml/2006/picture";
	auto pic = gData.append_child("pic:pic");
	auto nvPicPr = pic.append_child("pic:nvPicPr");
	auto cNvPr = nvPicPr.append_child("pic:cNvPr"); cNvPr.append_attribute("id") = "0"; cNvPr.append_attribute("name") = name.constData();
	nvPicPr.append_child("pic:cNvPicPr");
	auto blipFill = pic.append_child("pic:blipFill");
	auto blip = blipFill.append_child("a:blip"); blip.append_attribute("r:embed") = rId.constData();
	blipFill.append_child("a:stretch").append_child("a:fillRect");
	auto spPr = pic.append_child("pic:spPr");
	auto xfrm = spPr.append_child("a:xfrm");
	auto off = xfrm.append_child("a:off"); off.append_attribute("x") = "0"; off.append_attribute("y") = "0";
	auto ext = xfrm.append_child("a:ext"); ext.append_attribute("cx") = cx.c_str(); ext.append_attribute("cy") = cy.c_str();
	auto prstGeom = spPr.append_child("a:prstGeom"); prstGeom.append_attribute("prst") = "rect"; prstGeom.append_child("a:avLst");
	return xml::XmlPart::nodeToBytes(drawing);
}

}} // namespace DocxFill::engine
