// PyBind11 bindings for the nonorec core.
// Exposes catalog loading, the completion ledger and the recommendation
// engine to Python.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DBUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/chrono.h>

#include "catalog/puzzle.hpp"
#include "catalog/field_extractors.hpp"
#include "catalog/record_loader.hpp"
#include "ledger/completion_ledger.hpp"
#include "recommend/recommend_config.hpp"
#include "recommend/recommendation_engine.hpp"

#include <optional>

namespace py = pybind11;

namespace {

// kNeverDone has no datetime equivalent; it crosses as None.
std::optional<nonorec::Timestamp> toOptional(nonorec::Timestamp ts) {
    if (ts == nonorec::kNeverDone) return std::nullopt;
    return ts;
}

nonorec::Timestamp fromOptional(const std::optional<nonorec::Timestamp>& ts) {
    return ts ? *ts : nonorec::kNeverDone;
}

} // namespace

PYBIND11_MODULE(nonorec_bindings, m) {
    m.doc() = "nonorec C++ core bindings";

    // ── Enums ──
    py::enum_<nonorec::PuzzleCategory>(m, "PuzzleCategory")
        .value("COLOR", nonorec::PuzzleCategory::Color)
        .value("BLACK_WHITE", nonorec::PuzzleCategory::BlackWhite);

    py::enum_<nonorec::PuzzleDifficulty>(m, "PuzzleDifficulty")
        .value("TRUE_NONOGRAM", nonorec::PuzzleDifficulty::TrueNonogram)
        .value("OTHER_NONOGRAM", nonorec::PuzzleDifficulty::OtherNonogram);

    py::enum_<nonorec::Order>(m, "Order")
        .value("XP", nonorec::Order::XP)
        .value("XP_BY_SIZE", nonorec::Order::XPBySize);

    py::enum_<nonorec::Filter>(m, "Filter")
        .value("ALL", nonorec::Filter::All)
        .value("TRUE_NONOGRAM_ONLY", nonorec::Filter::TrueNonogramOnly);

    // ── PuzzleRecord ──
    py::class_<nonorec::PuzzleRecord>(m, "PuzzleRecord")
        .def(py::init<>())
        .def_readwrite("name", &nonorec::PuzzleRecord::name)
        .def_readwrite("xp", &nonorec::PuzzleRecord::xp)
        .def_readwrite("width", &nonorec::PuzzleRecord::width)
        .def_readwrite("height", &nonorec::PuzzleRecord::height)
        .def_readwrite("difficulty", &nonorec::PuzzleRecord::difficulty)
        .def_readwrite("category", &nonorec::PuzzleRecord::category)
        .def_property("last_done",
            [](const nonorec::PuzzleRecord& r) { return toOptional(r.last_done); },
            [](nonorec::PuzzleRecord& r, std::optional<nonorec::Timestamp> ts) {
                r.last_done = fromOptional(ts);
            })
        .def("size", &nonorec::PuzzleRecord::size)
        .def("score_per_size", &nonorec::PuzzleRecord::scorePerSize)
        .def("dimensions", &nonorec::PuzzleRecord::dimensions);

    // ── ColumnRef / CatalogLayout ──
    py::class_<nonorec::ColumnRef>(m, "ColumnRef")
        .def_static("by_name", &nonorec::ColumnRef::byName)
        .def_static("by_position", &nonorec::ColumnRef::byPosition)
        .def("describe", &nonorec::ColumnRef::describe);

    py::class_<nonorec::CatalogLayout>(m, "CatalogLayout")
        .def(py::init<>())
        .def_readwrite("name_column", &nonorec::CatalogLayout::name_column)
        .def_readwrite("xp_column", &nonorec::CatalogLayout::xp_column)
        .def_readwrite("size_column", &nonorec::CatalogLayout::size_column)
        .def_readwrite("type_column", &nonorec::CatalogLayout::type_column)
        .def_readwrite("true_nonogram_marker", &nonorec::CatalogLayout::true_nonogram_marker);

    // ── RecommendConfig ──
    py::class_<nonorec::RecommendConfig>(m, "RecommendConfig")
        .def(py::init<>())
        .def_readwrite("recent_window", &nonorec::RecommendConfig::recent_window)
        .def_readwrite("catalog", &nonorec::RecommendConfig::catalog)
        .def_readwrite("data_directory", &nonorec::RecommendConfig::data_directory)
        .def_readwrite("color_catalog_file", &nonorec::RecommendConfig::color_catalog_file)
        .def_readwrite("bw_catalog_file", &nonorec::RecommendConfig::bw_catalog_file)
        .def_readwrite("ledger_file", &nonorec::RecommendConfig::ledger_file)
        .def("catalog_path", &nonorec::RecommendConfig::catalogPath)
        .def("ledger_path", &nonorec::RecommendConfig::ledgerPath);

    // ── CompletionLedger ──
    py::class_<nonorec::CompletionLedger>(m, "CompletionLedger")
        .def(py::init<>())
        .def_static("load", &nonorec::CompletionLedger::load)
        .def("last_done", [](const nonorec::CompletionLedger& self, const std::string& name) {
            return toOptional(self.lastDone(name));
        })
        .def("contains", &nonorec::CompletionLedger::contains)
        .def("upsert", &nonorec::CompletionLedger::upsert)
        .def("save", &nonorec::CompletionLedger::save)
        .def("mark_done", &nonorec::CompletionLedger::markDone,
             py::arg("name"), py::arg("when"), py::arg("path"))
        .def("__len__", &nonorec::CompletionLedger::size);

    m.def("load_catalog",
        [](const std::string& path, nonorec::PuzzleCategory category,
           const nonorec::RecommendConfig& config, const nonorec::CompletionLedger& ledger) {
            return nonorec::loadCatalog(path, category, config.catalog, ledger);
        }, py::arg("path"), py::arg("category"), py::arg("config"), py::arg("ledger"));

    m.def("recommend",
        [](const std::vector<nonorec::PuzzleRecord>& records, nonorec::Order order,
           nonorec::Filter filter, const nonorec::RecommendConfig& config) {
            return nonorec::recommend(records, order, filter, nonorec::nowSeconds(), config);
        }, py::arg("records"), py::arg("order"), py::arg("filter"), py::arg("config"));

    m.def("default_recommend_config", []() {
        return nonorec::RecommendConfig{};
    });
}
