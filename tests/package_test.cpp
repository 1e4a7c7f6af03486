// Archive store: open failures, untouched parts, media and relationship registration, path helpers.
#include "DocxFill/Docx.hpp"
#include "opc/Package.hpp"
#include "TestDocx.hpp"
#include <QTemporaryDir>
#include <cassert>
#include <iostream>

using namespace DocxFill; using DocxFill::opc::Package; namespace RelType = DocxFill::opc::RelType;

int main(){
    // Not a zip / zip without the mandatory parts.
    {
        Package pkg;
        assert(!pkg.open(QByteArray("this is not a zip archive")));
        assert(!pkg.errorString().isEmpty());
        assert(!pkg.open(QByteArray()));
        Package noTypes; noTypes.writePart("word/document.xml", testdocx::documentXml("<w:p/>"));
        auto bytes = noTypes.serialize(); assert(bytes.has_value());
        assert(!pkg.open(*bytes));
        assert(pkg.errorString().contains("Content_Types"));
        Package noDoc; noDoc.writePart("[Content_Types].xml", QByteArray("<?xml version=\"1.0\"?><Types xmlns=\"http://schemas.openxmlformats.org/package/2006/content-types\"/>"));
        bytes = noDoc.serialize(); assert(bytes.has_value());
        assert(!pkg.open(*bytes));
        assert(pkg.errorString().contains("word/document.xml"));
        assert(!pkg.open(QStringLiteral("/nonexistent/dir/x.docx")));
    }
    const QByteArray input = testdocx::build(testdocx::Template{testdocx::para({"{{A}}"}), testdocx::para({"head"}), {}});
    // Nothing written: the input comes back unchanged.
    {
        Package pkg; assert(pkg.open(input));
        assert(pkg.mainDocumentPath() == "word/document.xml");
        assert(pkg.hasPart("word/styles.xml") && pkg.hasPart("word/header1.xml"));
        assert(pkg.dirtyParts().isEmpty());
        auto out = pkg.serialize(); assert(out.has_value());
        assert(*out == input);
        assert(pkg.contentTypeOf("word/document.xml").value().contains("document.main+xml"));
        assert(pkg.contentTypeOf("word/_rels/document.xml.rels").value().contains("relationships"));
        assert(!pkg.readPart("word/missing.xml").has_value());
    }
    // One part rewritten, the rest carried over.
    {
        Package pkg; assert(pkg.open(input));
        const QByteArray styles = *pkg.readPart("word/styles.xml");
        const QByteArray header = *pkg.readPart("word/header1.xml");
        pkg.writePart("word/document.xml", testdocx::documentXml(testdocx::para({"changed"})));
        assert(pkg.isDirty("word/document.xml") && !pkg.isDirty("word/styles.xml"));
        auto out = pkg.serialize(); assert(out.has_value());
        Package again; assert(again.open(*out));
        assert(*again.readPart("word/styles.xml") == styles);
        assert(*again.readPart("word/header1.xml") == header);
        assert(QString::fromUtf8(*again.readPart("word/document.xml")).contains("changed"));
        assert(again.partNames().size() == pkg.partNames().size());
    }
    // Media parts and relationships.
    {
        Package pkg; assert(pkg.open(input));
        QString m1 = pkg.addMedia("one", "PNG", "image/png");
        QString m2 = pkg.addMedia("two", "png", "image/png");
        assert(m1 == "word/media/image1.png" && m2 == "word/media/image2.png");
        QString m3 = pkg.addMedia("three", "jpeg", "image/jpeg");
        assert(m3 == "word/media/image3.jpeg");
        const QString types = QString::fromUtf8(*pkg.readPart("[Content_Types].xml"));
        assert(types.count("Extension=\"png\"") == 1);
        assert(types.count("Extension=\"jpeg\"") == 1);
        assert(types.contains("/word/document.xml"));
        assert(pkg.contentTypeOf(m1).value() == "image/png");

        const QString id1 = pkg.addRelationship("word/document.xml", m1, RelType::Image);
        const QString id2 = pkg.addRelationship("word/document.xml", m2, RelType::Image);
        assert(!id1.isEmpty() && !id2.isEmpty() && id1 != id2 && id1 != "rId1" && id1 != "rId2");
        assert(pkg.addRelationship("word/document.xml", "word/media/nothing.png", RelType::Image).isEmpty());
        auto rel = pkg.relationships("word/document.xml").byId(id1);
        assert(rel.has_value() && rel->target == "media/image1.png" && rel->type == RelType::Image);
        const QString hid = pkg.addRelationship("word/header1.xml", m3, RelType::Image);
        assert(hid == "rId1");
        assert(pkg.dirtyParts().contains("word/_rels/header1.xml.rels"));

        auto out = pkg.serialize(); assert(out.has_value());
        Package again; assert(again.open(*out));
        assert(*again.readPart(m2) == "two");
        assert(again.relationships("word/document.xml").byId(id2).has_value());
        assert(again.relationships("word/header1.xml").byType(RelType::Image).size() == 1);
        assert(again.relationships("word/document.xml").byType(RelType::Header).size() == 1);
        assert(again.contentTypeOf("word/media/image3.jpeg").value() == "image/jpeg");
    }
    // Path helpers.
    {
        assert(Package::relsPathFor("word/document.xml") == "word/_rels/document.xml.rels");
        assert(Package::relsPathFor("") == "_rels/.rels");
        assert(Package::resolveTarget("word/document.xml", "media/image1.png") == "word/media/image1.png");
        assert(Package::resolveTarget("word/document.xml", "../customXml/item1.xml") == "customXml/item1.xml");
        assert(Package::resolveTarget("", "word/document.xml") == "word/document.xml");
        assert(Package::resolveTarget("word/document.xml", "/word/footer1.xml") == "word/footer1.xml");
        assert(Package::relativeTarget("word/header1.xml", "word/media/image1.png") == "media/image1.png");
        assert(Package::relativeTarget("word/document.xml", "customXml/item1.xml") == "../customXml/item1.xml");
    }
    // An entry declaring 2 GiB or more is refused before anything is read.
    {
        auto le = [](QByteArray &out, quint32 v, int bytes) {
            for(int i = 0; i < bytes; ++i) out.append(static_cast<char>((v >> (8 * i)) & 0xff));
        };
        const QByteArray name("word/big.bin");
        const quint32 declared = 0x80000000u;
        QByteArray zip;
        le(zip, 0x04034b50u, 4); le(zip, 20, 2); le(zip, 0, 2); le(zip, 8, 2); le(zip, 0, 2); le(zip, 0x21, 2);
        le(zip, 0, 4); le(zip, 2, 4); le(zip, declared, 4); le(zip, name.size(), 2); le(zip, 0, 2);
        zip += name;
        zip.append('\x03'); zip.append('\x00'); // empty deflate stream
        const quint32 cdOffset = zip.size();
        le(zip, 0x02014b50u, 4); le(zip, 20, 2); le(zip, 20, 2); le(zip, 0, 2); le(zip, 8, 2); le(zip, 0, 2); le(zip, 0x21, 2);
        le(zip, 0, 4); le(zip, 2, 4); le(zip, declared, 4); le(zip, name.size(), 2); le(zip, 0, 2); le(zip, 0, 2);
        le(zip, 0, 2); le(zip, 0, 2); le(zip, 0, 4); le(zip, 0, 4);
        zip += name;
        const quint32 cdSize = zip.size() - cdOffset;
        le(zip, 0x06054b50u, 4); le(zip, 0, 2); le(zip, 0, 2); le(zip, 1, 2); le(zip, 1, 2);
        le(zip, cdSize, 4); le(zip, cdOffset, 4); le(zip, 0, 2);

        Package pkg;
        assert(!pkg.open(zip));
        assert(pkg.errorString().contains("too large"));
        Docx d = Docx::fromBytes(zip);
        assert(d.readTextContent().isEmpty());
        assert(d.lastError() == Docx::ErrorCode::CorruptArchive);
    }
    // saveAs writes an archive that opens again.
    {
        QTemporaryDir dir; assert(dir.isValid());
        Package pkg; assert(pkg.open(input));
        const QString path = dir.path() + "/copy.docx";
        assert(pkg.saveAs(path));
        Package again; assert(again.open(path));
        assert(again.partNames().contains("word/document.xml"));
    }
    std::cout << "package_test passed" << std::endl; return 0;
}
