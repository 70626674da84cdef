// ============= include/quickroll/recognition/similarity_classifier.hpp =============
/*
 * Similarity Classifier - score -> RECOGNIZED / MAYBE / UNKNOWN
 *
 * SCORING:
 * - Score de una identidad = max similitud contra todas sus referencias
 *   (una por pose capturada)
 * - Ranking descendente, empates por orden de alta (stable sort)
 *
 * BANDAS (defaults):
 * - score >= 0.75          -> RECOGNIZED
 * - 0.50 <= score < 0.75   -> MAYBE (solo orientativo)
 * - score < 0.50           -> UNKNOWN, identidad suprimida
 * - top_matches excluye candidatos < 0.40
 *
 * CONCURRENCIA:
 * - La tabla de identidades es inmutable; reload() arma una nueva y
 *   cambia el handle. Los lectores nunca ven una tabla a medias.
 */

#pragma once
#include "quickroll/core/types.hpp"
#include "quickroll/config.hpp"
#include "quickroll/recognition/face_embedder.hpp"
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

namespace quickroll {

class FaceStore;

struct ConfidenceThresholds {
    float high = Config::HIGH_CONFIDENCE;
    float low = Config::LOW_CONFIDENCE;
    float min = Config::MIN_CONFIDENCE;
};

struct ClassificationResult {
    std::string identity;           // vacio = ninguna
    std::string name = "Unknown";
    RecognitionStatus status = RecognitionStatus::UNKNOWN;
    float score = 0.0f;
    bool aligned = false;           // embedding con landmarks o recorte simple
};

struct CandidateMatch {
    std::string identity;
    std::string name;
    float score;
};

class SimilarityClassifier {
public:
    SimilarityClassifier(std::shared_ptr<FaceEmbedder> embedder,
                         const ConfidenceThresholds& thresholds = ConfidenceThresholds());

    ClassificationResult classify(const cv::Mat& image, const Detection* alignment = nullptr) const;
    ClassificationResult classify_embedding(const Embedding& probe) const;

    std::vector<CandidateMatch> top_matches(const cv::Mat& image, const Detection* alignment,
                                            size_t n) const;
    std::vector<CandidateMatch> top_matches_embedding(const Embedding& probe, size_t n) const;

    void reload(std::vector<EnrolledIdentity> identities);
    bool reload_from(FaceStore& store);

    size_t identity_count() const;
    const ConfidenceThresholds& thresholds() const { return limits; }

    RecognitionStatus status_for(float score) const;

private:
    struct IdentityTable {
        std::vector<EnrolledIdentity> identities;   // orden de alta
    };

    std::shared_ptr<FaceEmbedder> embedder;
    ConfidenceThresholds limits;

    mutable std::shared_mutex table_mutex;          // protege solo el handle
    std::shared_ptr<const IdentityTable> table;

    std::shared_ptr<const IdentityTable> snapshot() const;
    Embedding embed_probe(const cv::Mat& image, const Detection* alignment) const;
    std::vector<CandidateMatch> rank(const IdentityTable& t, const Embedding& probe) const;
};

}  // namespace quickroll
