#include "quickroll/recognition/similarity_classifier.hpp"
#include "quickroll/database/face_store.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <mutex>
#include <stdexcept>

namespace quickroll {

SimilarityClassifier::SimilarityClassifier(std::shared_ptr<FaceEmbedder> embedder,
                                           const ConfidenceThresholds& thresholds)
    : embedder(std::move(embedder)), limits(thresholds),
      table(std::make_shared<IdentityTable>())
{
    if (!this->embedder) {
        throw std::invalid_argument("SimilarityClassifier requiere un embedder");
    }

    spdlog::info("Similarity Classifier initialized");
    spdlog::info("   HIGH: {:.2f}, LOW: {:.2f}, MIN: {:.2f}",
                 limits.high, limits.low, limits.min);
}

// ==================== TABLE ====================

std::shared_ptr<const SimilarityClassifier::IdentityTable> SimilarityClassifier::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(table_mutex);
    return table;
}

void SimilarityClassifier::reload(std::vector<EnrolledIdentity> identities) {
    auto fresh = std::make_shared<IdentityTable>();
    size_t references = 0;

    for (auto& identity : identities) {
        auto& refs = identity.references;
        refs.erase(std::remove_if(refs.begin(), refs.end(),
                                  [](const Embedding& e) { return e.empty(); }),
                   refs.end());
        if (refs.empty()) {
            spdlog::warn("Identity {} has no usable embeddings, skipped", identity.id);
            continue;
        }
        if (identity.name.empty()) {
            identity.name = "Unknown";
        }
        references += refs.size();
        fresh->identities.push_back(std::move(identity));
    }

    size_t count = fresh->identities.size();
    {
        std::unique_lock<std::shared_mutex> lock(table_mutex);
        table = std::move(fresh);
    }

    spdlog::info("✓ Identity table reloaded: {} identities, {} embeddings", count, references);
}

bool SimilarityClassifier::reload_from(FaceStore& store) {
    auto identities = store.load_identities();
    reload(std::move(identities));
    return identity_count() > 0;
}

size_t SimilarityClassifier::identity_count() const {
    return snapshot()->identities.size();
}

// ==================== SCORING ====================

RecognitionStatus SimilarityClassifier::status_for(float score) const {
    if (score >= limits.high) return RecognitionStatus::RECOGNIZED;
    if (score >= limits.low) return RecognitionStatus::MAYBE;
    return RecognitionStatus::UNKNOWN;
}

Embedding SimilarityClassifier::embed_probe(const cv::Mat& image, const Detection* alignment) const {
    if (image.empty()) {
        return {};
    }
    try {
        return embedder->embed(image, alignment);
    } catch (const std::exception& e) {
        spdlog::warn("Embedder failed: {}", e.what());
        return {};
    }
}

std::vector<CandidateMatch> SimilarityClassifier::rank(const IdentityTable& t,
                                                       const Embedding& probe) const {
    std::vector<CandidateMatch> scores;
    scores.reserve(t.identities.size());

    for (const auto& identity : t.identities) {
        float best = 0.0f;
        for (const auto& reference : identity.references) {
            float s = embedder->similarity(probe, reference);
            if (s > best) {
                best = s;
            }
        }
        scores.push_back({identity.id, identity.name, best});
    }

    std::stable_sort(scores.begin(), scores.end(),
                     [](const CandidateMatch& a, const CandidateMatch& b) {
                         return a.score > b.score;
                     });
    return scores;
}

// ==================== CLASSIFY ====================

ClassificationResult SimilarityClassifier::classify(const cv::Mat& image,
                                                    const Detection* alignment) const {
    Embedding probe = embed_probe(image, alignment);
    ClassificationResult result = classify_embedding(probe);
    result.aligned = alignment != nullptr && !probe.empty();
    return result;
}

ClassificationResult SimilarityClassifier::classify_embedding(const Embedding& probe) const {
    ClassificationResult result;
    if (probe.empty()) {
        return result;
    }

    auto t = snapshot();
    if (t->identities.empty()) {
        return result;
    }

    auto scores = rank(*t, probe);
    const auto& best = scores.front();

    result.score = best.score;
    result.status = status_for(best.score);

    switch (result.status) {
        case RecognitionStatus::RECOGNIZED:
        case RecognitionStatus::MAYBE:
            result.identity = best.identity;
            result.name = best.name;
            break;
        case RecognitionStatus::UNKNOWN:
        case RecognitionStatus::COOLDOWN:
        case RecognitionStatus::NO_FACE:
            break;
    }

    spdlog::debug("classify: {} -> {} ({:.3f})", best.identity, to_string(result.status), best.score);
    return result;
}

std::vector<CandidateMatch> SimilarityClassifier::top_matches(const cv::Mat& image,
                                                             const Detection* alignment,
                                                             size_t n) const {
    return top_matches_embedding(embed_probe(image, alignment), n);
}

std::vector<CandidateMatch> SimilarityClassifier::top_matches_embedding(const Embedding& probe,
                                                                       size_t n) const {
    std::vector<CandidateMatch> top;
    if (probe.empty() || n == 0) {
        return top;
    }

    auto t = snapshot();
    auto scores = rank(*t, probe);

    for (const auto& candidate : scores) {
        if (top.size() >= n) break;
        if (candidate.score >= limits.min) {
            top.push_back(candidate);
        }
    }
    return top;
}

}  // namespace quickroll
