#include "batch/batch_serialize.hpp"
#include "binning/binning_serialize.hpp"
#include "similarity/similarity_serialize.hpp"
#include "utils/serialization.hpp"

enum OutcomeTag : uint8_t { NOT_COMPUTED = 0, SCORE = 1, FAILURE = 2 };

bool Batch::Serialize::read_cell(std::istream &stream, Batch::Cell *cell) {
    Serialization::read_string(stream, &cell->query_id);
    Serialization::read_string(stream, &cell->candidate_id);
    Serialization::read_bool(stream, &cell->self_comparison);
    uint8_t tag = 0;
    Serialization::read_uint8(stream, &tag);
    switch (tag) {
        case OutcomeTag::NOT_COMPUTED: {
            cell->outcome = std::monostate{};
        } break;
        case OutcomeTag::SCORE: {
            Similarity::Score score = {};
            if (!Similarity::Serialize::read_score(stream, &score)) {
                return false;
            }
            cell->outcome = std::move(score);
        } break;
        case OutcomeTag::FAILURE: {
            Batch::PairwiseComparisonFailure failure = {};
            Serialization::read_string(stream, &failure.reason);
            cell->outcome = std::move(failure);
        } break;
        default:
            return false;
    }
    return stream.good();
}

bool Batch::Serialize::write_cell(std::ostream &stream,
                                  const Batch::Cell &cell) {
    Serialization::write_string(stream, cell.query_id);
    Serialization::write_string(stream, cell.candidate_id);
    Serialization::write_bool(stream, cell.self_comparison);
    if (auto score = std::get_if<Similarity::Score>(&cell.outcome)) {
        Serialization::write_uint8(stream, OutcomeTag::SCORE);
        Similarity::Serialize::write_score(stream, *score);
    } else if (auto failure = std::get_if<Batch::PairwiseComparisonFailure>(
                   &cell.outcome)) {
        Serialization::write_uint8(stream, OutcomeTag::FAILURE);
        Serialization::write_string(stream, failure->reason);
    } else {
        Serialization::write_uint8(stream, OutcomeTag::NOT_COMPUTED);
    }
    return stream.good();
}

bool Batch::Serialize::read_report(std::istream &stream,
                                   Batch::Report *report) {
    Serialization::read_vector<std::string>(stream, &report->query_ids,
                                            Serialization::read_string);
    Serialization::read_vector<std::string>(stream, &report->candidate_ids,
                                            Serialization::read_string);
    if (!Serialization::read_vector<Batch::Cell>(
            stream, &report->cells, Batch::Serialize::read_cell)) {
        return false;
    }
    if (report->cells.size() !=
        report->query_ids.size() * report->candidate_ids.size()) {
        return false;
    }
    Binning::Serialize::read_config(stream, &report->config);
    Similarity::Serialize::read_metric(stream, &report->metric);
    Serialization::read_bool(stream, &report->cancelled);
    return stream.good();
}

bool Batch::Serialize::write_report(std::ostream &stream,
                                    const Batch::Report &report) {
    Serialization::write_vector<std::string>(stream, report.query_ids,
                                             Serialization::write_string);
    Serialization::write_vector<std::string>(stream, report.candidate_ids,
                                             Serialization::write_string);
    Serialization::write_vector<Batch::Cell>(stream, report.cells,
                                             Batch::Serialize::write_cell);
    Binning::Serialize::write_config(stream, report.config);
    Similarity::Serialize::write_metric(stream, report.metric);
    Serialization::write_bool(stream, report.cancelled);
    return stream.good();
}
