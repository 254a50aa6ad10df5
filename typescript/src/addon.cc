#include <node_api.h>

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "diagram_stream.hpp"

using diagram_stream::DiagramArtifact;
using diagram_stream::DiagramStreamError;
using diagram_stream::FenceEmission;
using diagram_stream::FenceExtractor;
using diagram_stream::FenceOptions;

static void ThrowTypeError(napi_env env, const char* msg) { napi_throw_type_error(env, nullptr, msg); }

static napi_value MakeString(napi_env env, const std::string& s) {
  napi_value out;
  napi_create_string_utf8(env, s.c_str(), s.size(), &out);
  return out;
}

static napi_value MakeBool(napi_env env, bool b) {
  napi_value out;
  napi_get_boolean(env, b, &out);
  return out;
}

static napi_value MakeNumber(napi_env env, double d) {
  napi_value out;
  napi_create_double(env, d, &out);
  return out;
}

static napi_value Undefined(napi_env env) {
  napi_value undef;
  napi_get_undefined(env, &undef);
  return undef;
}

static napi_value Null(napi_env env) {
  napi_value out;
  napi_get_null(env, &out);
  return out;
}

static void ThrowErrorWithKind(napi_env env, const std::string& msg, const std::string& kind) {
  napi_value message = MakeString(env, msg);
  napi_value err;
  napi_create_error(env, nullptr, message, &err);
  napi_set_named_property(env, err, "message", message);
  napi_set_named_property(env, err, "kind", MakeString(env, kind));
  napi_throw(env, err);
}

static void ThrowDiagramStreamError(napi_env env, const DiagramStreamError& e) {
  napi_value message = MakeString(env, e.message);
  napi_value err;
  napi_create_error(env, nullptr, message, &err);
  napi_set_named_property(env, err, "message", message);
  napi_set_named_property(env, err, "name", MakeString(env, "DiagramStreamError"));
  napi_set_named_property(env, err, "kind", MakeString(env, diagram_stream::error_kind_name(e.kind)));
  napi_throw(env, err);
}

static bool GetStringUtf8(napi_env env, napi_value v, std::string& out) {
  napi_valuetype t;
  if (napi_typeof(env, v, &t) != napi_ok) return false;
  if (t != napi_string) return false;

  size_t len = 0;
  if (napi_get_value_string_utf8(env, v, nullptr, 0, &len) != napi_ok) return false;

  out.resize(len);
  size_t written = 0;
  if (napi_get_value_string_utf8(env, v, out.data(), out.size() + 1, &written) != napi_ok) return false;
  out.resize(written);
  return true;
}

static bool IsNullish(napi_env env, napi_value v) {
  napi_valuetype t;
  if (napi_typeof(env, v, &t) != napi_ok) return true;
  return t == napi_undefined || t == napi_null;
}

static bool GetOptionalStringProperty(napi_env env, napi_value obj, const char* key, std::string& out) {
  bool has = false;
  if (napi_has_named_property(env, obj, key, &has) != napi_ok) return false;
  if (!has) return true;
  napi_value v;
  if (napi_get_named_property(env, obj, key, &v) != napi_ok) return false;
  if (!GetStringUtf8(env, v, out)) {
    ThrowTypeError(env, "fence markers must be strings");
    return false;
  }
  return true;
}

static bool GetOptionalSizeTProperty(napi_env env, napi_value obj, const char* key, size_t& out) {
  bool has = false;
  if (napi_has_named_property(env, obj, key, &has) != napi_ok) return false;
  if (!has) return true;

  napi_value v;
  if (napi_get_named_property(env, obj, key, &v) != napi_ok) return false;

  napi_valuetype t;
  if (napi_typeof(env, v, &t) != napi_ok) return false;
  if (t != napi_number) {
    ThrowTypeError(env, "fence limits must be numbers");
    return false;
  }

  double d = 0;
  if (napi_get_value_double(env, v, &d) != napi_ok) return false;
  if (d < 0) {
    ThrowTypeError(env, "fence limits must be >= 0");
    return false;
  }
  out = static_cast<size_t>(d);
  return true;
}

static bool FenceOptionsFromNapi(napi_env env, napi_value v, FenceOptions& opt) {
  if (IsNullish(env, v)) return true;
  napi_valuetype t;
  if (napi_typeof(env, v, &t) != napi_ok) return false;
  if (t != napi_object) {
    ThrowTypeError(env, "fence options must be an object");
    return false;
  }
  return GetOptionalStringProperty(env, v, "openMarker", opt.open_marker) &&
         GetOptionalStringProperty(env, v, "closeMarker", opt.close_marker) &&
         GetOptionalSizeTProperty(env, v, "minFlushLines", opt.min_flush_lines) &&
         GetOptionalSizeTProperty(env, v, "maxBufferBytes", opt.max_buffer_bytes);
}

template <typename T>
static bool GetExternalPtr(napi_env env, napi_value v, T*& out) {
  napi_valuetype t;
  if (napi_typeof(env, v, &t) != napi_ok) return false;
  if (t != napi_external) return false;
  void* ptr = nullptr;
  if (napi_get_value_external(env, v, &ptr) != napi_ok) return false;
  out = static_cast<T*>(ptr);
  return out != nullptr;
}

static const char* EmissionKindName(FenceEmission::Kind kind) {
  switch (kind) {
    case FenceEmission::Kind::Settle: return "settle";
    case FenceEmission::Kind::Partial: return "partial";
    case FenceEmission::Kind::Complete: return "complete";
  }
  return "partial";
}

static napi_value EmissionsToNapi(napi_env env, const std::vector<FenceEmission>& emissions) {
  napi_value arr;
  napi_create_array_with_length(env, emissions.size(), &arr);
  for (size_t i = 0; i < emissions.size(); ++i) {
    napi_value obj;
    napi_create_object(env, &obj);
    napi_set_named_property(env, obj, "kind", MakeString(env, EmissionKindName(emissions[i].kind)));
    napi_set_named_property(env, obj, "text", MakeString(env, emissions[i].text));
    napi_set_named_property(env, obj, "flushedLines", MakeNumber(env, static_cast<double>(emissions[i].flushed_lines)));
    napi_set_element(env, arr, static_cast<uint32_t>(i), obj);
  }
  return arr;
}

static napi_value ArtifactToNapi(napi_env env, const DiagramArtifact& a) {
  napi_value obj;
  napi_create_object(env, &obj);
  napi_set_named_property(env, obj, "diagramType", MakeString(env, a.diagram_type));
  napi_set_named_property(env, obj, "rawText", MakeString(env, a.raw_text));
  napi_set_named_property(env, obj, "normalizedText", MakeString(env, a.normalized_text));
  napi_set_named_property(env, obj, "isValid", MakeBool(env, a.is_valid));
  if (!a.is_valid) napi_set_named_property(env, obj, "validationMessage", MakeString(env, a.validation_message));
  return obj;
}

static napi_value DiagramTypes(napi_env env, napi_callback_info /*info*/) {
  const auto& defs = diagram_stream::default_catalog().definitions();
  napi_value arr;
  napi_create_array_with_length(env, defs.size(), &arr);
  for (size_t i = 0; i < defs.size(); ++i) {
    napi_value obj;
    napi_create_object(env, &obj);
    napi_set_named_property(env, obj, "id", MakeString(env, defs[i].id));
    napi_set_named_property(env, obj, "declaration", MakeString(env, defs[i].canonical_declaration));
    napi_value aliases;
    napi_create_array_with_length(env, defs[i].aliases.size(), &aliases);
    for (size_t j = 0; j < defs[i].aliases.size(); ++j) {
      napi_set_element(env, aliases, static_cast<uint32_t>(j), MakeString(env, defs[i].aliases[j]));
    }
    napi_set_named_property(env, obj, "aliases", aliases);
    napi_set_element(env, arr, static_cast<uint32_t>(i), obj);
  }
  return arr;
}

static napi_value ExtractFencedCandidate(napi_env env, napi_callback_info info) {
  size_t argc = 2;
  napi_value argv[2];
  napi_value this_arg;
  void* data;
  if (napi_get_cb_info(env, info, &argc, argv, &this_arg, &data) != napi_ok) return nullptr;
  if (argc < 1 || argc > 2) {
    ThrowTypeError(env, "extractFencedCandidate(text, options?) expects 1-2 arguments");
    return nullptr;
  }

  std::string text;
  if (!GetStringUtf8(env, argv[0], text)) {
    ThrowTypeError(env, "extractFencedCandidate(text) expects a string");
    return nullptr;
  }
  FenceOptions opt;
  if (argc == 2 && !FenceOptionsFromNapi(env, argv[1], opt)) return nullptr;

  auto candidate = diagram_stream::extract_fenced_candidate(text, opt);
  return candidate ? MakeString(env, *candidate) : Null(env);
}

static napi_value PrepareArtifact(napi_env env, napi_callback_info info) {
  size_t argc = 3;
  napi_value argv[3];
  napi_value this_arg;
  void* data;
  if (napi_get_cb_info(env, info, &argc, argv, &this_arg, &data) != napi_ok) return nullptr;
  if (argc < 2 || argc > 3) {
    ThrowTypeError(env, "prepareArtifact(raw, diagramType, validatorCmd?) expects 2-3 arguments");
    return nullptr;
  }

  std::string raw;
  std::string type;
  if (!GetStringUtf8(env, argv[0], raw) || !GetStringUtf8(env, argv[1], type)) {
    ThrowTypeError(env, "prepareArtifact(raw, diagramType) expects strings");
    return nullptr;
  }
  std::string validator_cmd;
  if (argc == 3 && !IsNullish(env, argv[2]) && !GetStringUtf8(env, argv[2], validator_cmd)) {
    ThrowTypeError(env, "prepareArtifact(..., validatorCmd) expects a string");
    return nullptr;
  }

  try {
    const auto& def = diagram_stream::default_catalog().at(type);
    if (!validator_cmd.empty()) {
      diagram_stream::CommandValidator validator(validator_cmd);
      return ArtifactToNapi(env, diagram_stream::prepare_artifact(raw, def, validator));
    }
    diagram_stream::BasicSyntaxValidator validator(diagram_stream::default_catalog());
    return ArtifactToNapi(env, diagram_stream::prepare_artifact(raw, def, validator));
  } catch (const DiagramStreamError& e) {
    ThrowDiagramStreamError(env, e);
    return nullptr;
  } catch (const std::exception& e) {
    ThrowErrorWithKind(env, e.what(), "validation");
    return nullptr;
  }
}

static napi_value CompilePrompt(napi_env env, napi_callback_info info) {
  size_t argc = 1;
  napi_value argv[1];
  napi_value this_arg;
  void* data;
  if (napi_get_cb_info(env, info, &argc, argv, &this_arg, &data) != napi_ok) return nullptr;
  std::string body;
  if (argc != 1 || !GetStringUtf8(env, argv[0], body)) {
    ThrowTypeError(env, "compilePrompt(requestJson) expects a string");
    return nullptr;
  }

  try {
    auto req = diagram_stream::parse_generation_request(body);
    diagram_stream::PromptCompiler compiler(diagram_stream::default_catalog());
    auto compiled = compiler.compile(req);

    napi_value messages;
    napi_create_array_with_length(env, compiled.messages.size(), &messages);
    for (size_t i = 0; i < compiled.messages.size(); ++i) {
      napi_value m;
      napi_create_object(env, &m);
      napi_set_named_property(env, m, "role", MakeString(env, compiled.messages[i].role));
      napi_set_named_property(env, m, "content", MakeString(env, compiled.messages[i].content));
      napi_set_element(env, messages, static_cast<uint32_t>(i), m);
    }

    napi_value obj;
    napi_create_object(env, &obj);
    napi_set_named_property(env, obj, "system", MakeString(env, compiled.system));
    napi_set_named_property(env, obj, "messages", messages);
    napi_set_named_property(env, obj, "temperature", MakeNumber(env, compiled.sampling.temperature));
    napi_set_named_property(env, obj, "topP", MakeNumber(env, compiled.sampling.top_p));
    napi_set_named_property(env, obj, "maxTokens", MakeNumber(env, compiled.sampling.max_tokens));
    return obj;
  } catch (const DiagramStreamError& e) {
    ThrowDiagramStreamError(env, e);
    return nullptr;
  } catch (const std::exception& e) {
    ThrowErrorWithKind(env, e.what(), "rejected");
    return nullptr;
  }
}

static void FinalizeFenceExtractor(napi_env /*env*/, void* data, void* /*hint*/) {
  delete static_cast<FenceExtractor*>(data);
}

static napi_value CreateFenceExtractor(napi_env env, napi_callback_info info) {
  size_t argc = 1;
  napi_value argv[1];
  napi_value this_arg;
  void* data;
  if (napi_get_cb_info(env, info, &argc, argv, &this_arg, &data) != napi_ok) return nullptr;
  FenceOptions opt;
  if (argc == 1 && !FenceOptionsFromNapi(env, argv[0], opt)) return nullptr;

  auto* fx = new FenceExtractor(std::move(opt));
  napi_value ext;
  napi_create_external(env, fx, FinalizeFenceExtractor, nullptr, &ext);
  return ext;
}

static FenceExtractor* ExtractorArg(napi_env env, napi_callback_info info, size_t expected, napi_value* argv,
                                    const char* usage) {
  size_t argc = expected;
  napi_value this_arg;
  void* data;
  if (napi_get_cb_info(env, info, &argc, argv, &this_arg, &data) != napi_ok) return nullptr;
  FenceExtractor* fx = nullptr;
  if (argc != expected || !GetExternalPtr(env, argv[0], fx)) {
    ThrowTypeError(env, usage);
    return nullptr;
  }
  return fx;
}

static napi_value FenceExtractorFeed(napi_env env, napi_callback_info info) {
  napi_value argv[2];
  auto* fx = ExtractorArg(env, info, 2, argv, "fenceExtractorFeed(extractor, delta) expects an extractor and a string");
  if (!fx) return nullptr;
  std::string delta;
  if (!GetStringUtf8(env, argv[1], delta)) {
    ThrowTypeError(env, "fenceExtractorFeed(extractor, delta) expects a string delta");
    return nullptr;
  }
  return EmissionsToNapi(env, fx->feed(delta));
}

static napi_value FenceExtractorFinish(napi_env env, napi_callback_info info) {
  napi_value argv[1];
  auto* fx = ExtractorArg(env, info, 1, argv, "fenceExtractorFinish(extractor) expects an extractor external");
  if (!fx) return nullptr;
  return EmissionsToNapi(env, fx->finish());
}

static napi_value FenceExtractorReset(napi_env env, napi_callback_info info) {
  napi_value argv[1];
  auto* fx = ExtractorArg(env, info, 1, argv, "fenceExtractorReset(extractor) expects an extractor external");
  if (!fx) return nullptr;
  fx->reset();
  return Undefined(env);
}

static napi_value FenceExtractorState(napi_env env, napi_callback_info info) {
  napi_value argv[1];
  auto* fx = ExtractorArg(env, info, 1, argv, "fenceExtractorState(extractor) expects an extractor external");
  if (!fx) return nullptr;
  napi_value obj;
  napi_create_object(env, &obj);
  napi_set_named_property(env, obj, "state", MakeString(env, diagram_stream::fence_state_name(fx->state())));
  auto candidate = fx->candidate();
  napi_set_named_property(env, obj, "candidate", candidate ? MakeString(env, *candidate) : Null(env));
  napi_set_named_property(env, obj, "visible", MakeString(env, fx->session().visible));
  if (!fx->session().abort_reason.empty()) {
    napi_set_named_property(env, obj, "abortReason", MakeString(env, fx->session().abort_reason));
  }
  return obj;
}

static napi_value Init(napi_env env, napi_value exports) {
  napi_property_descriptor props[] = {
      {"diagramTypes", nullptr, DiagramTypes, nullptr, nullptr, nullptr, napi_default, nullptr},
      {"extractFencedCandidate", nullptr, ExtractFencedCandidate, nullptr, nullptr, nullptr, napi_default, nullptr},
      {"prepareArtifact", nullptr, PrepareArtifact, nullptr, nullptr, nullptr, napi_default, nullptr},
      {"compilePrompt", nullptr, CompilePrompt, nullptr, nullptr, nullptr, napi_default, nullptr},
      {"createFenceExtractor", nullptr, CreateFenceExtractor, nullptr, nullptr, nullptr, napi_default, nullptr},
      {"fenceExtractorFeed", nullptr, FenceExtractorFeed, nullptr, nullptr, nullptr, napi_default, nullptr},
      {"fenceExtractorFinish", nullptr, FenceExtractorFinish, nullptr, nullptr, nullptr, napi_default, nullptr},
      {"fenceExtractorReset", nullptr, FenceExtractorReset, nullptr, nullptr, nullptr, napi_default, nullptr},
      {"fenceExtractorState", nullptr, FenceExtractorState, nullptr, nullptr, nullptr, napi_default, nullptr},
  };

  napi_define_properties(env, exports, sizeof(props) / sizeof(props[0]), props);
  return exports;
}

NAPI_MODULE(NODE_GYP_MODULE_NAME, Init)
