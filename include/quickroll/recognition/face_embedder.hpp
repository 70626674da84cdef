// ============= include/quickroll/recognition/face_embedder.hpp =============
/*
 * Face Embedder - SFace (OpenCV objdetect)
 *
 * CARACTERISTICAS:
 * - Interfaz abstracta FaceEmbedder: embed() + similarity()
 * - Con landmarks: alignCrop a 112x112 (mas preciso)
 * - Sin landmarks: resize directo del recorte (fallback)
 * - Similitud coseno recortada a [0, 1]
 *
 * OUTPUT:
 * - Vector de 128 floats; vacio si falla
 */

#pragma once
#include "quickroll/core/types.hpp"
#include "quickroll/config.hpp"
#include <opencv2/objdetect.hpp>
#include <string>

namespace quickroll {

class FaceEmbedder {
public:
    virtual ~FaceEmbedder() = default;

    // alignment == nullptr -> recorte sin alinear
    virtual Embedding embed(const cv::Mat& image, const Detection* alignment = nullptr) = 0;

    virtual float similarity(const Embedding& a, const Embedding& b) const = 0;
};

class SFaceEmbedder : public FaceEmbedder {
public:
    explicit SFaceEmbedder(const std::string& model_path = Config::DEFAULT_RECOGNIZER_MODEL);

    Embedding embed(const cv::Mat& image, const Detection* alignment = nullptr) override;
    float similarity(const Embedding& a, const Embedding& b) const override;

    bool is_loaded() const { return !recognizer.empty(); }

    // Coseno para embeddings ya normalizados
    static float compare(const Embedding& emb1, const Embedding& emb2);
    static void l2_normalize(Embedding& embedding);

private:
    cv::Ptr<cv::FaceRecognizerSF> recognizer;
    int input_size = Config::EMBEDDING_INPUT_SIZE;
};

}  // namespace quickroll
