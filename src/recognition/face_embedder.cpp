#include "quickroll/recognition/face_embedder.hpp"
#include "quickroll/detection/face_detector.hpp"
#include <spdlog/spdlog.h>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>

namespace quickroll {

SFaceEmbedder::SFaceEmbedder(const std::string& model_path) {
    spdlog::info("Inicializando SFace Recognizer");
    spdlog::info("   Model: {}", model_path);

    try {
        recognizer = cv::FaceRecognizerSF::create(model_path, "");
    } catch (const cv::Exception& e) {
        spdlog::error("No se pudo cargar SFace ({}): {}", model_path, e.what());
        recognizer.release();
        return;
    }

    spdlog::info("✓ SFace ready ({}x{} input)", input_size, input_size);
}

Embedding SFaceEmbedder::embed(const cv::Mat& image, const Detection* alignment) {
    if (recognizer.empty() || image.empty()) {
        return {};
    }

    cv::Mat feature;
    try {
        if (alignment) {
            cv::Mat aligned;
            recognizer->alignCrop(image, YuNetDetector::to_face_row(*alignment), aligned);
            recognizer->feature(aligned, feature);
        } else {
            cv::Mat resized;
            cv::resize(image, resized, cv::Size(input_size, input_size));
            recognizer->feature(resized, feature);
        }
    } catch (const cv::Exception& e) {
        spdlog::warn("Embedding fallo: {}", e.what());
        return {};
    }

    if (feature.empty()) {
        return {};
    }

    cv::Mat flat = feature.reshape(1, 1);
    if (flat.type() != CV_32F) {
        flat.convertTo(flat, CV_32F);
    }
    return Embedding(flat.ptr<float>(0), flat.ptr<float>(0) + flat.cols);
}

float SFaceEmbedder::similarity(const Embedding& a, const Embedding& b) const {
    if (a.size() != b.size() || a.empty()) {
        spdlog::error("Embedding size mismatch: {} vs {}", a.size(), b.size());
        return 0.0f;
    }

    if (!recognizer.empty()) {
        cv::Mat fa(1, static_cast<int>(a.size()), CV_32F, const_cast<float*>(a.data()));
        cv::Mat fb(1, static_cast<int>(b.size()), CV_32F, const_cast<float*>(b.data()));
        try {
            double cosine = recognizer->match(fa, fb, cv::FaceRecognizerSF::FR_COSINE);
            return std::max(0.0f, std::min(1.0f, static_cast<float>(cosine)));
        } catch (const cv::Exception& e) {
            spdlog::warn("SFace match fallo: {}", e.what());
            return 0.0f;
        }
    }

    // Sin modelo: mismo coseno a mano
    Embedding na = a;
    Embedding nb = b;
    l2_normalize(na);
    l2_normalize(nb);
    return std::max(0.0f, compare(na, nb));
}

float SFaceEmbedder::compare(const Embedding& emb1, const Embedding& emb2) {
    if (emb1.size() != emb2.size() || emb1.empty()) {
        spdlog::error("Embedding size mismatch: {} vs {}", emb1.size(), emb2.size());
        return 0.0f;
    }

    float dot_product = 0.0f;
    for (size_t i = 0; i < emb1.size(); i++) {
        dot_product += emb1[i] * emb2[i];
    }

    // Clamp to [-1, 1] (numerical stability)
    return std::max(-1.0f, std::min(1.0f, dot_product));
}

void SFaceEmbedder::l2_normalize(Embedding& embedding) {
    float norm = 0.0f;
    for (float val : embedding) {
        norm += val * val;
    }
    norm = std::sqrt(norm);

    if (norm > 0) {
        for (float& val : embedding) {
            val /= norm;
        }
    }
}

}  // namespace quickroll
