#include "similarity/similarity_serialize.hpp"
#include "binning/binning_serialize.hpp"
#include "utils/serialization.hpp"

bool Similarity::Serialize::read_metric(std::istream &stream,
                                        Similarity::Metric *metric) {
    uint8_t value = 0;
    Serialization::read_uint8(stream, &value);
    if (value > Similarity::Metric::REVERSE_COSINE) {
        return false;
    }
    *metric = static_cast<Similarity::Metric>(value);
    return stream.good();
}

bool Similarity::Serialize::write_metric(std::ostream &stream,
                                         Similarity::Metric metric) {
    return Serialization::write_uint8(stream, metric);
}

bool Similarity::Serialize::read_score(std::istream &stream,
                                       Similarity::Score *score) {
    Serialization::read_string(stream, &score->id_a);
    Serialization::read_string(stream, &score->id_b);
    Serialization::read_double(stream, &score->value);
    if (!read_metric(stream, &score->metric)) {
        return false;
    }
    Binning::Serialize::read_config(stream, &score->config);
    return stream.good();
}

bool Similarity::Serialize::write_score(std::ostream &stream,
                                        const Similarity::Score &score) {
    Serialization::write_string(stream, score.id_a);
    Serialization::write_string(stream, score.id_b);
    Serialization::write_double(stream, score.value);
    write_metric(stream, score.metric);
    Binning::Serialize::write_config(stream, score.config);
    return stream.good();
}

bool Similarity::Serialize::read_scores(
    std::istream &stream, std::vector<Similarity::Score> *scores) {
    return Serialization::read_vector<Similarity::Score>(
        stream, scores, Similarity::Serialize::read_score);
}

bool Similarity::Serialize::write_scores(
    std::ostream &stream, const std::vector<Similarity::Score> &scores) {
    return Serialization::write_vector<Similarity::Score>(
        stream, scores, Similarity::Serialize::write_score);
}
