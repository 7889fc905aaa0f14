#include "extraction/consistency_auditor.hpp"

#include <algorithm>
#include <cmath>
#include <memory>
#include <utility>

#include <QRandomGenerator>

#include "common/errors.hpp"
#include "common/logging.hpp"

namespace foldermind {

ConsistencyAuditor::ConsistencyAuditor(CoordinateStore &store,
                                       const TextReconstructor &reconstructor,
                                       EmbeddingBackendProvider &embeddings,
                                       FlagHandler onFlag)
    : m_store(store)
    , m_reconstructor(reconstructor)
    , m_embeddings(embeddings)
    , m_onFlag(std::move(onFlag))
{
}

bool ConsistencyAuditor::embeddingsMatch(const std::vector<float> &a,
                                         const std::vector<float> &b,
                                         float tolerance)
{
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::fabs(a[i] - b[i]) > tolerance) {
            return false;
        }
    }
    return true;
}

AuditReport ConsistencyAuditor::auditFolder(const MonitoredFolder &folder,
                                            const std::string &modelId,
                                            int sampleSize) const
{
    AuditReport report;
    report.folderId = folder.id;

    std::vector<std::pair<Document, ChunkRecord>> candidates;
    for (const Document &document : m_store.listDocuments(folder.id)) {
        if (document.needsReindex) {
            continue;
        }
        for (ChunkRecord &chunk : m_store.chunksForDocument(document.id)) {
            candidates.emplace_back(document, std::move(chunk));
        }
    }
    if (candidates.empty()) {
        return report;
    }

    if (sampleSize > 0 && candidates.size() > static_cast<std::size_t>(sampleSize)) {
        QRandomGenerator *random = QRandomGenerator::global();
        for (std::size_t i = 0; i < static_cast<std::size_t>(sampleSize); ++i) {
            const auto remaining = static_cast<quint64>(candidates.size() - i);
            const std::size_t pick = i + static_cast<std::size_t>(random->bounded(remaining));
            std::swap(candidates[i], candidates[pick]);
        }
        candidates.resize(static_cast<std::size_t>(sampleSize));
    }

    const std::shared_ptr<EmbeddingBackend> backend = m_embeddings.backendFor(modelId);
    for (const auto &candidate : candidates) {
        const Document &document = candidate.first;
        const ChunkRecord &chunk = candidate.second;
        if (std::find(report.flaggedDocuments.begin(), report.flaggedDocuments.end(),
                      document.id) != report.flaggedDocuments.end()) {
            continue;
        }

        ++report.chunksChecked;
        const DocumentHandle handle{document.path, document.format, document.mimeType,
                                    document.contentHash};
        std::string reason;
        try {
            const std::string text = m_reconstructor.extract(chunk.coordinates, handle);
            if (!embeddingsMatch(backend->embed(text), chunk.embedding)) {
                reason = "embedding_drift";
            }
        } catch (const CoordinateMismatchError &error) {
            reason = error.what();
        }
        if (reason.empty()) {
            continue;
        }

        report.flaggedDocuments.push_back(document.id);
        FMLOG_WARN(QStringLiteral("ConsistencyAuditor"),
                   QStringLiteral("ConsistencyAuditor::auditFolder"),
                   QStringLiteral("audit_mismatch"),
                   QString::fromStdString(reason),
                   QStringLiteral("flag_for_reindex"),
                   QString(),
                   logging::currentCorrelationId(),
                   (nlohmann::json{{"folderId", folder.id},
                                   {"documentId", document.id},
                                   {"chunkId", chunk.id},
                                   {"path", document.path}}));
        if (m_onFlag) {
            m_onFlag(document.id);
        }
    }

    FMLOG_INFO(QStringLiteral("ConsistencyAuditor"),
               QStringLiteral("ConsistencyAuditor::auditFolder"),
               QStringLiteral("audit_completed"),
               QStringLiteral("periodic_audit"),
               QStringLiteral("sample_reextract"),
               QString(),
               logging::currentCorrelationId(),
               (nlohmann::json{{"folderId", folder.id},
                               {"checked", report.chunksChecked},
                               {"flagged", report.flaggedDocuments.size()}}));
    return report;
}

} // namespace foldermind
