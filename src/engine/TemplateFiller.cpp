#include "engine/TemplateFiller.hpp"
#include "engine/Replacers.hpp"
#include "DocxFill/Builder.hpp"
#include "DocxFill/ImageVariable.hpp"
#include "DocxFill/TextVariable.hpp"
#include "opc/Package.hpp"
#include "util/Emu.hpp"
#include "xml/XmlPart.hpp"
#include <QDebug>
#include <QFileInfo>
#include <algorithm>
#include <memory>

namespace DocxFill { namespace engine {

TemplateFiller::TemplateFiller(opc::Package &package, const FillOptions &options)
    : m_package(package), m_options(options), m_scanner(options.pattern) {}

bool TemplateFiller::setError(Docx::ErrorCode code, const QString &message) {
    m_error = code;
    m_errorMessage = message;
    qWarning().noquote() << "TemplateFiller:" << errorCodeName(code) << "-" << message;
    return false;
}

QStringList TemplateFiller::targetParts(const opc::Package &package) {
    const QString main = package.mainDocumentPath();
    QStringList out{main};
    const QStringList relTypes{opc::RelType::Header, opc::RelType::Footer, opc::RelType::Footnotes, opc::RelType::Endnotes};
    for(const auto &rel : package.relationships(main).entries()) {
        if(rel.isExternal() || !relTypes.contains(rel.type)) continue;
        out << opc::Package::resolveTarget(main, rel.target);
    }
    // Header/footer parts nobody references are still template text.
    for(const auto &name : package.partNames()) {
        if(name.startsWith(QLatin1String("word/header")) && name.endsWith(QLatin1String(".xml"))) out << name;
        else if(name.startsWith(QLatin1String("word/footer")) && name.endsWith(QLatin1String(".xml"))) out << name;
    }
    out.removeDuplicates();
    return out;
}

bool TemplateFiller::isImageToken(const QString &name) const {
    return name.startsWith(ImageSizeTable::tokenPrefix()) && m_options.imageSizes.contains(name);
}

bool TemplateFiller::fill(const Variables &variables) {
    m_text.clear(); m_images.clear(); m_decoded.clear(); m_misses.clear(); m_unresolved.clear();
    m_textReplacements = 0; m_imagesInjected = 0;
    m_error.reset(); m_errorMessage.clear();

    for(const auto &v : variables.all()) {
        const QString name = unwrapKey(v->key(), m_options.pattern);
        if(v->type() == VariableType::Text) m_text[name] = static_cast<const TextVariable *>(v.get())->value();
        else if(v->type() == VariableType::Image) m_images[name] = static_cast<const ImageVariable *>(v.get())->payload();
    }

    // Load and validate everything before the first edit.
    struct LoadedPart { QString path; std::unique_ptr<xml::XmlPart> xml; };
    std::vector<LoadedPart> parts;
    const QString mainPath = m_package.mainDocumentPath();
    for(const auto &path : targetParts(m_package)) {
        auto data = m_package.readPart(path);
        if(!data) {
            if(path == mainPath) return setError(Docx::ErrorCode::CorruptArchive, QStringLiteral("main document part %1 missing").arg(path));
            qWarning() << "TemplateFiller: referenced part missing, skipped:" << path;
            continue;
        }
        auto part = std::make_unique<xml::XmlPart>();
        if(!part->load(*data)) return setError(Docx::ErrorCode::XmlParseFailed, QStringLiteral("%1: %2").arg(path, part->errorString()));
        if(path == mainPath && part->selectAll("//w:body").empty())
            return setError(Docx::ErrorCode::CorruptArchive, QStringLiteral("%1 has no w:body").arg(path));
        for(const auto &docPr : part->selectAll("//wp:docPr")) {
            m_lastDocPrId = std::max(m_lastDocPrId, docPr.attribute("id").as_uint());
        }
        parts.push_back({path, std::move(part)});
    }

    for(int pi = 0; pi < static_cast<int>(parts.size()); ++pi) {
        const auto &lp = parts[pi];
        const auto paragraphs = lp.xml->selectAll("//w:p");
        bool changed = false;
        // Reverse document order: rewriting an outer paragraph never invalidates a nested text-box paragraph still to visit.
        for(int i = static_cast<int>(paragraphs.size()) - 1; i >= 0; --i) {
            if(!processContainer(paragraphs[i], lp.path, pi, i, changed)) return false;
        }
        if(changed) {
            m_package.writePart(lp.path, lp.xml->save());
            qDebug() << "TemplateFiller: rewrote" << lp.path;
        }
    }

    std::sort(m_misses.begin(), m_misses.end(), [](const Miss &a, const Miss &b){
        if(a.part != b.part) return a.part < b.part;
        if(a.paragraph != b.paragraph) return a.paragraph < b.paragraph;
        return a.position < b.position;
    });
    for(const auto &m : m_misses) if(!m_unresolved.contains(m.token)) m_unresolved << m.token;
    for(const auto &token : m_unresolved) qWarning().noquote() << "TemplateFiller: no value for" << token << "- left as literal text";
    qInfo().noquote() << QStringLiteral("TemplateFiller: %1 text replacement(s), %2 image(s), %3 unresolved token(s)")
                         .arg(m_textReplacements).arg(m_imagesInjected).arg(m_unresolved.size());
    return true;
}

bool TemplateFiller::processContainer(pugi::xml_node paragraph, const QString &partPath, int partIndex, int paragraphIndex, bool &changed) {
    RunModel model;
    model.build(paragraph);
    if(!model.text().contains(m_options.pattern.prefix)) return true;
    const std::vector<Span> spans = m_scanner.scan(model.container());
    if(spans.empty()) return true;

    // An image token takes over its whole paragraph.
    for(const auto &span : spans) {
        if(!isImageToken(span.name)) continue;
        auto img = m_images.find(span.name);
        if(img == m_images.end()) continue;
        if(!injectImage(model, span, partPath, img->second)) return false;
        if(model.commit()) changed = true;
        ++m_imagesInjected;
        return true;
    }

    bool edited = false;
    for(auto it = spans.rbegin(); it != spans.rend(); ++it) {
        auto value = m_text.find(it->name);
        if(value == m_text.end()) {
            m_misses.push_back({partIndex, paragraphIndex, it->logicalStart, m_options.pattern.wrap(it->name)});
            continue;
        }
        Replacers::replaceText(model.container(), *it, value->second);
        edited = true;
        ++m_textReplacements;
    }
    if(edited && model.commit()) changed = true;
    return true;
}

bool TemplateFiller::injectImage(RunModel &model, const Span &span, const QString &partPath, const QByteArray &payload) {
    auto cached = m_decoded.find(span.name);
    if(cached == m_decoded.end()) {
        QString why;
        auto img = decodeImagePayload(payload, &why);
        if(!img) return setError(Docx::ErrorCode::InvalidImagePayload, QStringLiteral("%1: %2").arg(span.name, why));
        cached = m_decoded.emplace(span.name, std::move(*img)).first;
    }
    const DecodedImage &img = cached->second;

    const QString mediaPath = m_package.addMedia(img.bytes, img.extension, img.mimeType);
    const QString rId = m_package.addRelationship(partPath, mediaPath, opc::RelType::Image);
    if(rId.isEmpty()) return setError(Docx::ErrorCode::PartWriteFailed, QStringLiteral("cannot relate %1 to %2").arg(mediaPath, partPath));

    const double widthIn = m_options.imageSizes.widthInches(span.name).value_or(0.0);
    const double heightIn = img.nativeSize.height() * (widthIn / img.nativeSize.width());
    PictureRef picture;
    picture.relationshipId = rId;
    picture.cx = util::inchesToEmu(widthIn);
    picture.cy = util::inchesToEmu(heightIn);
    picture.docPrId = ++m_lastDocPrId;
    picture.name = QFileInfo(mediaPath).fileName();
    picture.description = span.name;
    if(!Replacers::injectImage(model.container(), span, picture))
        return setError(Docx::ErrorCode::PartWriteFailed, QStringLiteral("cannot build drawing for %1").arg(span.name));
    qDebug().noquote() << "TemplateFiller:" << span.name << "->" << mediaPath << rId
                       << QStringLiteral("%1x%2 in").arg(widthIn).arg(heightIn, 0, 'f', 3);
    return true;
}

}} // namespace DocxFill::engine
