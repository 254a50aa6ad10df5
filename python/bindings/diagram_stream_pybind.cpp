#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#include "diagram_stream.hpp"

namespace py = pybind11;

using diagram_stream::DiagramArtifact;
using diagram_stream::DiagramStreamError;
using diagram_stream::FenceEmission;
using diagram_stream::FenceExtractor;
using diagram_stream::FenceOptions;
using diagram_stream::Json;
using diagram_stream::JsonArray;
using diagram_stream::JsonObject;

static py::object ToPy(const Json& v);

static py::object ToPyNumber(double n) {
  if (std::isfinite(n)) {
    const double ip = std::trunc(n);
    if (ip == n && ip >= static_cast<double>(std::numeric_limits<int64_t>::min()) &&
        ip <= static_cast<double>(std::numeric_limits<int64_t>::max())) {
      return py::int_(static_cast<int64_t>(ip));
    }
  }
  return py::float_(n);
}

static py::object ToPy(const Json& v) {
  if (v.is_null()) return py::none();
  if (v.is_bool()) return py::bool_(v.as_bool());
  if (v.is_number()) return ToPyNumber(v.as_number());
  if (v.is_string()) return py::str(v.as_string());
  if (v.is_array()) {
    py::list out;
    for (const auto& el : v.as_array()) out.append(ToPy(el));
    return std::move(out);
  }
  py::dict d;
  for (const auto& kv : v.as_object()) d[py::str(kv.first)] = ToPy(kv.second);
  return std::move(d);
}

static py::object DiagramStreamErrorType;

static void TranslateDiagramStreamError(const DiagramStreamError& e) {
  py::object exc = DiagramStreamErrorType(py::str(e.message));
  exc.attr("message") = py::str(e.message);
  exc.attr("kind") = py::str(diagram_stream::error_kind_name(e.kind));
  PyErr_SetObject(DiagramStreamErrorType.ptr(), exc.ptr());
}

static FenceOptions FenceOptionsFromPy(py::object o) {
  FenceOptions opt;
  if (o.is_none()) return opt;
  py::dict d = o.cast<py::dict>();
  if (d.contains("openMarker")) opt.open_marker = d["openMarker"].cast<std::string>();
  if (d.contains("closeMarker")) opt.close_marker = d["closeMarker"].cast<std::string>();
  if (d.contains("minFlushLines")) opt.min_flush_lines = d["minFlushLines"].cast<size_t>();
  if (d.contains("maxBufferBytes")) opt.max_buffer_bytes = d["maxBufferBytes"].cast<size_t>();
  return opt;
}

static const char* EmissionKindName(FenceEmission::Kind kind) {
  switch (kind) {
    case FenceEmission::Kind::Settle: return "settle";
    case FenceEmission::Kind::Partial: return "partial";
    case FenceEmission::Kind::Complete: return "complete";
  }
  return "partial";
}

static py::list EmissionsToPy(const std::vector<FenceEmission>& emissions) {
  py::list out;
  for (const auto& e : emissions) {
    py::dict d;
    d["kind"] = EmissionKindName(e.kind);
    d["text"] = e.text;
    d["flushedLines"] = py::int_(e.flushed_lines);
    out.append(d);
  }
  return out;
}

static py::dict ArtifactToPy(const DiagramArtifact& a) {
  py::dict d;
  d["diagramType"] = a.diagram_type;
  d["rawText"] = a.raw_text;
  d["normalizedText"] = a.normalized_text;
  d["isValid"] = a.is_valid;
  if (!a.is_valid) d["validationMessage"] = a.validation_message;
  return d;
}

static py::list MessagesToPy(const std::vector<diagram_stream::ChatMessage>& messages) {
  py::list out;
  for (const auto& m : messages) {
    py::dict d;
    d["role"] = m.role;
    d["content"] = m.content;
    out.append(d);
  }
  return out;
}

PYBIND11_MODULE(_native, m) {
  m.doc() = "C++17-backed Mermaid diagram stream stages (pybind11)";

  DiagramStreamErrorType = py::reinterpret_steal<py::object>(
      PyErr_NewException("diagram_stream.DiagramStreamError", PyExc_Exception, nullptr));
  m.attr("DiagramStreamError") = DiagramStreamErrorType;

  py::register_exception_translator([](std::exception_ptr p) {
    try {
      if (p) std::rethrow_exception(p);
    } catch (const DiagramStreamError& e) {
      TranslateDiagramStreamError(e);
    }
  });

  m.def("diagram_types", []() {
    py::list out;
    for (const auto& def : diagram_stream::default_catalog().definitions()) {
      py::dict d;
      d["id"] = def.id;
      d["declaration"] = def.canonical_declaration;
      d["aliases"] = def.aliases;
      out.append(d);
    }
    return out;
  });

  m.def("resolve_type", [](const std::string& type) -> py::object {
    const auto* def = diagram_stream::default_catalog().find(type);
    if (!def) return py::none();
    return py::str(def->id);
  });

  m.def("extract_fenced_candidate", [](const std::string& text, py::object options) {
    return diagram_stream::extract_fenced_candidate(text, FenceOptionsFromPy(options));
  }, py::arg("text"), py::arg("options") = py::none());

  m.def("normalize_declaration", [](const std::string& raw, const std::string& type) {
    return diagram_stream::normalize_declaration(raw, diagram_stream::default_catalog().at(type));
  });

  m.def("sanitize_diagram", [](const std::string& text, const std::string& type) {
    return diagram_stream::sanitize_diagram(text, diagram_stream::default_catalog().at(type));
  });

  m.def("validate", [](const std::string& text, const std::string& type) {
    diagram_stream::BasicSyntaxValidator validator(diagram_stream::default_catalog());
    auto r = validator.validate(text, type);
    py::dict d;
    d["valid"] = r.valid;
    d["message"] = r.message;
    return d;
  });

  m.def("prepare_artifact", [](const std::string& raw, const std::string& type, py::object validator_cmd) {
    const auto& def = diagram_stream::default_catalog().at(type);
    if (!validator_cmd.is_none()) {
      diagram_stream::CommandValidator validator(validator_cmd.cast<std::string>());
      return ArtifactToPy(diagram_stream::prepare_artifact(raw, def, validator));
    }
    diagram_stream::BasicSyntaxValidator validator(diagram_stream::default_catalog());
    return ArtifactToPy(diagram_stream::prepare_artifact(raw, def, validator));
  }, py::arg("raw"), py::arg("diagram_type"), py::arg("validator_cmd") = py::none());

  m.def("compile_prompt", [](const std::string& request_json) {
    auto req = diagram_stream::parse_generation_request(request_json);
    diagram_stream::PromptCompiler compiler(diagram_stream::default_catalog());
    auto compiled = compiler.compile(req);
    py::dict d;
    d["system"] = compiled.system;
    d["messages"] = MessagesToPy(compiled.messages);
    d["temperature"] = compiled.sampling.temperature;
    d["topP"] = compiled.sampling.top_p;
    d["maxTokens"] = compiled.sampling.max_tokens;
    return d;
  });

  m.def("loads_json", [](const std::string& text) { return ToPy(diagram_stream::loads_json(text)); });

  py::class_<FenceExtractor>(m, "FenceExtractor")
      .def(py::init([](py::object options) { return new FenceExtractor(FenceOptionsFromPy(options)); }),
           py::arg("options") = py::none())
      .def("feed", [](FenceExtractor& self, const std::string& delta) { return EmissionsToPy(self.feed(delta)); })
      .def("finish", [](FenceExtractor& self) { return EmissionsToPy(self.finish()); })
      .def("reset", &FenceExtractor::reset)
      .def("state", [](const FenceExtractor& self) { return diagram_stream::fence_state_name(self.state()); })
      .def("candidate", &FenceExtractor::candidate)
      .def("abort_reason", [](const FenceExtractor& self) { return self.session().abort_reason; });
}
