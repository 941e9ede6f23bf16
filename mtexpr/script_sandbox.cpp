// Copyright (c) 2021, Tencent Inc.
// All rights reserved.
#include "mtexpr/script_sandbox.h"
#include <ctype.h>
#include <stdlib.h>
#include <string.h>
#include <algorithm>
#include <boost/algorithm/string.hpp>
#include <unordered_set>
#include "mtexpr/expression_parser.h"
#include "mtexpr/mtexpr_err.h"
#include "mtexpr/mtexpr_log.h"

namespace mtexpr {

static const char kScriptFile[] = "constraint.js";

// Bound as parameters, in this order, after self/model/metamodel.
static const char* const kStandardGlobals[] = {
    "Math",       "Date",       "JSON",           "String",       "Number",
    "Array",      "Object",     "Boolean",        "RegExp",       "parseInt",
    "parseFloat", "isNaN",      "isFinite",       "encodeURI",    "encodeURIComponent",
    "decodeURI",  "decodeURIComponent", "Error",  "TypeError",    "RangeError",
    "SyntaxError", "ReferenceError", "console"};

static const char kCollectionOperations[] = R"JS(
(function () {
  var proto = Array.prototype;
  var getters = {
    size: function () { return this.length; },
    isEmpty: function () { return this.length === 0; },
    notEmpty: function () { return this.length > 0; }
  };
  var methods = {
    excludes: function (item) { return !this.includes(item); },
    includesAll: function (items) {
      var self = this;
      return items.every(function (item) { return self.includes(item); });
    },
    excludesAll: function (items) {
      var self = this;
      return items.every(function (item) { return !self.includes(item); });
    },
    count: function (predicate) {
      if (typeof predicate === 'function') {
        return this.filter(predicate).length;
      }
      return this.filter(function (item) { return [item].includes(predicate); }).length;
    },
    exists: function (predicate) { return this.some(predicate); },
    forAll: function (predicate) { return this.every(predicate); },
    select: function (predicate) { return this.filter(predicate); },
    reject: function (predicate) {
      return this.filter(function (item) { return !predicate(item); });
    },
    collect: function (mapper) { return this.map(mapper); },
    sum: function () { return this.reduce(function (a, b) { return a + b; }, 0); },
    any: function (predicate) { return this.find(predicate); },
    one: function (predicate) { return this.filter(predicate).length === 1; }
  };
  Object.keys(getters).forEach(function (name) {
    Object.defineProperty(proto, name, { get: getters[name], configurable: true });
  });
  Object.keys(methods).forEach(function (name) {
    Object.defineProperty(proto, name,
                          { value: methods[name], writable: true, configurable: true });
  });
})();
)JS";

std::string ScriptToString(JSContext* ctx, JSValueConst v) {
  size_t len = 0;
  const char* s = JS_ToCStringLen(ctx, &len, v);
  if (s == nullptr) {
    JS_FreeValue(ctx, JS_GetException(ctx));
    return "";
  }
  std::string out(s, len);
  JS_FreeCString(ctx, s);
  return out;
}

static void SetProperty(JSContext* ctx, JSValueConst obj, const std::string& key, JSValue v) {
  // the engine frees `v` when the store fails
  if (JS_SetPropertyStr(ctx, obj, key.c_str(), v) < 0) {
    MTEXPR_DEBUG("Failed to set script property '{}'", key);
  }
}

static void AppendItem(JSContext* ctx, JSValueConst array, uint32_t& n, JSValue v) {
  if (JS_SetPropertyUint32(ctx, array, n++, v) < 0) {
    MTEXPR_DEBUG("Failed to append script array item {}", n - 1);
  }
}

static JSValue NewString(JSContext* ctx, const std::string& s) {
  return JS_NewStringLen(ctx, s.data(), s.size());
}

static JSValue ValueToScript(JSContext* ctx, const Value& v) {
  if (const bool* b = std::get_if<bool>(&v)) {
    return JS_NewBool(ctx, *b);
  }
  if (const double* d = std::get_if<double>(&v)) {
    return JS_NewFloat64(ctx, *d);
  }
  if (const std::string* s = std::get_if<std::string>(&v)) {
    return NewString(ctx, *s);
  }
  return JS_NULL;
}

static void CopyAttributes(JSContext* ctx, JSValueConst obj, const AttributeMap& attrs) {
  for (const auto& kv : attrs) {
    SetProperty(ctx, obj, kv.first, ValueToScript(ctx, kv.second));
  }
}

// Line of a syntax error, from the `at constraint.js:<line>` frame of its stack, or 0.
static int ErrorLine(JSContext* ctx, JSValueConst exception) {
  ScopedJSValue stack(ctx, JS_GetPropertyStr(ctx, exception, "stack"));
  if (!JS_IsString(stack.Get())) {
    return 0;
  }
  std::string frames = ScriptToString(ctx, stack.Get());
  std::string marker = std::string(kScriptFile) + ":";
  size_t pos = frames.find(marker);
  if (pos == std::string::npos) {
    return 0;
  }
  return atoi(frames.c_str() + pos + marker.size());
}

static JSValue ConsoleLog(JSContext* ctx, JSValueConst this_val, int argc, JSValueConst* argv) {
  std::string line;
  for (int i = 0; i < argc; i++) {
    if (i > 0) {
      line.push_back(' ');
    }
    line.append(ScriptToString(ctx, argv[i]));
  }
  MTEXPR_DEBUG("[constraint] {}", line);
  return JS_UNDEFINED;
}

ScriptContext::ScriptContext(const ScriptLimits& limits) : limits_(limits) {}

ScriptContext::~ScriptContext() {
  for (auto& binding : bindings_) {
    JS_FreeValue(ctx_, binding.second);
  }
  bindings_.clear();
  if (nullptr != ctx_) {
    JS_FreeContext(ctx_);
  }
  if (nullptr != rt_) {
    JS_FreeRuntime(rt_);
  }
}

int ScriptContext::OnInterrupt(JSRuntime* rt, void* opaque) {
  ScriptContext* sandbox = static_cast<ScriptContext*>(opaque);
  if (std::chrono::steady_clock::now() < sandbox->deadline_) {
    return 0;
  }
  sandbox->timed_out_ = true;
  return 1;
}

void ScriptContext::ArmDeadline() {
  deadline_ = std::chrono::steady_clock::now() + std::chrono::milliseconds(limits_.timeout_ms);
  timed_out_ = false;
}

int ScriptContext::Init(std::string& error) {
  rt_ = JS_NewRuntime();
  if (nullptr == rt_) {
    error = "Failed to create script runtime";
    return MTEXPR_ERR_ENGINE_INIT;
  }
  JS_SetMemoryLimit(rt_, static_cast<size_t>(limits_.memory_limit));
  JS_SetMaxStackSize(rt_, static_cast<size_t>(limits_.max_stack_size));
  JS_SetInterruptHandler(rt_, OnInterrupt, this);
  ctx_ = JS_NewContextRaw(rt_);
  if (nullptr == ctx_) {
    error = "Failed to create script context";
    return MTEXPR_ERR_ENGINE_INIT;
  }
  JS_SetContextOpaque(ctx_, this);
  JS_AddIntrinsicBaseObjects(ctx_);
  JS_AddIntrinsicDate(ctx_);
  JS_AddIntrinsicEval(ctx_);
  JS_AddIntrinsicRegExpCompiler(ctx_);
  JS_AddIntrinsicRegExp(ctx_);
  JS_AddIntrinsicJSON(ctx_);

  ArmDeadline();
  JSValue installed = JS_Eval(ctx_, kCollectionOperations, strlen(kCollectionOperations),
                              "<collections>", JS_EVAL_TYPE_GLOBAL);
  if (JS_IsException(installed)) {
    error = "Failed to install collection operations: " + TakeException();
    return MTEXPR_ERR_ENGINE_INIT;
  }
  JS_FreeValue(ctx_, installed);

  ScopedJSValue global(ctx_, JS_GetGlobalObject(ctx_));
  JSValue console = JS_NewObject(ctx_);
  for (const char* level : {"log", "info", "warn", "error", "debug"}) {
    SetProperty(ctx_, console, level, JS_NewCFunction(ctx_, ConsoleLog, level, 1));
  }
  SetProperty(ctx_, global.Get(), "console", console);
  return RestrictGlobals(error);
}

int ScriptContext::RestrictGlobals(std::string& error) {
  static const std::unordered_set<std::string> kKept = [] {
    std::unordered_set<std::string> names(std::begin(kStandardGlobals),
                                          std::end(kStandardGlobals));
    names.insert({"undefined", "NaN", "Infinity"});
    return names;
  }();
  ScopedJSValue global(ctx_, JS_GetGlobalObject(ctx_));
  JSPropertyEnum* props = nullptr;
  uint32_t count = 0;
  if (JS_GetOwnPropertyNames(ctx_, &props, &count, global.Get(), JS_GPN_STRING_MASK) < 0) {
    error = "Failed to list script globals: " + TakeException();
    return MTEXPR_ERR_ENGINE_INIT;
  }
  for (uint32_t i = 0; i < count; i++) {
    const char* name = JS_AtomToCString(ctx_, props[i].atom);
    std::string global_name = name != nullptr ? name : "";
    JS_FreeCString(ctx_, name);
    if (kKept.count(global_name) == 0 &&
        JS_DeleteProperty(ctx_, global.Get(), props[i].atom, 0) != 1) {
      MTEXPR_DEBUG("Script global '{}' is not configurable", global_name);
    }
    JS_FreeAtom(ctx_, props[i].atom);
  }
  js_free(ctx_, props);
  return MTEXPR_OK;
}

void ScriptContext::Bind(const std::string& name, JSValue v) {
  for (auto& binding : bindings_) {
    if (binding.first == name) {
      JS_FreeValue(ctx_, binding.second);
      binding.second = v;
      return;
    }
  }
  bindings_.emplace_back(name, v);
}

bool ScriptContext::IsBound(const std::string& name) const {
  for (const auto& binding : bindings_) {
    if (binding.first == name) {
      return true;
    }
  }
  return false;
}

JSValueConst ScriptContext::Binding(const std::string& name) const {
  for (const auto& binding : bindings_) {
    if (binding.first == name) {
      return binding.second;
    }
  }
  return JS_UNDEFINED;
}

std::vector<std::string> ScriptContext::Names() const {
  std::vector<std::string> names;
  names.reserve(bindings_.size());
  for (const auto& binding : bindings_) {
    names.push_back(binding.first);
  }
  return names;
}

std::string ScriptContext::TakeException(int* line) {
  ScopedJSValue exception(ctx_, JS_GetException(ctx_));
  if (!JS_IsError(ctx_, exception.Get())) {
    return ScriptToString(ctx_, exception.Get());
  }
  if (nullptr != line) {
    *line = ErrorLine(ctx_, exception.Get());
  }
  ScopedJSValue message(ctx_, JS_GetPropertyStr(ctx_, exception.Get(), "message"));
  return ScriptToString(ctx_, message.Get());
}

int ScriptContext::Compile(const std::string& body, bool compile_only, JSValue& fn,
                           std::string& error) {
  fn = JS_UNDEFINED;
  if (nullptr == ctx_) {
    error = "Script context is not initialized";
    return MTEXPR_ERR_ENGINE_INIT;
  }
  // the body starts on line 2, the closing brace follows its last line
  std::string source = "(function (";
  for (size_t i = 0; i < bindings_.size(); i++) {
    if (i > 0) {
      source.append(", ");
    }
    source.append(bindings_[i].first);
  }
  source.append(") { \"use strict\";\n");
  source.append(body);
  source.append("\n})");
  int last_body_line = 2 + static_cast<int>(std::count(body.begin(), body.end(), '\n'));

  int flags = JS_EVAL_TYPE_GLOBAL;
  if (compile_only) {
    flags |= JS_EVAL_FLAG_COMPILE_ONLY;
  }
  ArmDeadline();
  JSValue compiled = JS_Eval(ctx_, source.c_str(), source.size(), kScriptFile, flags);
  if (JS_IsException(compiled)) {
    int line = 0;
    error = TakeException(&line);
    if (line > last_body_line) {
      error = "Unexpected end of input";
      return MTEXPR_ERR_UNEXPECTED_EOF;
    }
    return MTEXPR_ERR_SYNTAX;
  }
  if (compile_only) {
    JS_FreeValue(ctx_, compiled);
  } else {
    fn = compiled;
  }
  return MTEXPR_OK;
}

int ScriptContext::Call(JSValueConst fn, JSValue& result, std::string& error) {
  std::vector<JSValue> args;
  args.reserve(bindings_.size());
  for (const auto& binding : bindings_) {
    args.push_back(binding.second);
  }
  ArmDeadline();
  result = JS_Call(ctx_, fn, JS_UNDEFINED, static_cast<int>(args.size()), args.data());
  if (!JS_IsException(result)) {
    return MTEXPR_OK;
  }
  error = TakeException();
  if (timed_out_) {
    error = fmt::format("Script exceeded the time limit of {} ms", limits_.timeout_ms);
    return MTEXPR_ERR_TIMEOUT;
  }
  return MTEXPR_ERR_RUNTIME;
}

JSValue ElementToScript(JSContext* ctx, const ModelElement& element) {
  JSValue obj = JS_NewObject(ctx);
  SetProperty(ctx, obj, "id", NewString(ctx, element.id));
  if (element.name) {
    SetProperty(ctx, obj, "name", NewString(ctx, *element.name));
  }
  if (element.type) {
    SetProperty(ctx, obj, "type", NewString(ctx, *element.type));
  }
  SetProperty(ctx, obj, "modelElementId", NewString(ctx, element.model_element_id));
  JSValue style = JS_NewObject(ctx);
  CopyAttributes(ctx, style, element.style);
  SetProperty(ctx, obj, "style", style);
  JSValue refs = JS_NewObject(ctx);
  for (const auto& kv : element.references) {
    const ReferenceValue& ref = kv.second;
    if (ref.many) {
      JSValue ids = JS_NewArray(ctx);
      uint32_t n = 0;
      for (const auto& target : ref.targets) {
        AppendItem(ctx, ids, n, NewString(ctx, target));
      }
      SetProperty(ctx, refs, kv.first, ids);
    } else if (!ref.targets.empty()) {
      SetProperty(ctx, refs, kv.first, NewString(ctx, ref.targets[0]));
    } else {
      SetProperty(ctx, refs, kv.first, JS_NULL);
    }
  }
  SetProperty(ctx, obj, "references", refs);
  return obj;
}

JSValue ElementView(JSContext* ctx, const ModelElement& element) {
  JSValue view = JS_NewObject(ctx);
  CopyAttributes(ctx, view, element.style);
  SetProperty(ctx, view, "id", NewString(ctx, element.id));
  SetProperty(ctx, view, "type", NewString(ctx, element.model_element_id));
  return view;
}

JSValue BuildSelf(JSContext* ctx, const ModelElement& element, const Model& model) {
  JSValue self = ElementView(ctx, element);
  for (const auto& kv : element.references) {
    const ReferenceValue& ref = kv.second;
    if (ref.many) {
      JSValue targets = JS_NewArray(ctx);
      uint32_t n = 0;
      for (const auto& target_id : ref.targets) {
        const ModelElement* target = model.FindElement(target_id);
        if (target != nullptr) {
          AppendItem(ctx, targets, n, ElementView(ctx, *target));
        }
      }
      SetProperty(ctx, self, kv.first, targets);
    } else if (!ref.targets.empty()) {
      const ModelElement* target = model.FindElement(ref.targets[0]);
      if (target != nullptr) {
        SetProperty(ctx, self, kv.first, ElementView(ctx, *target));
      }
    }
  }
  return self;
}

JSValue BuildModelObject(JSContext* ctx, const Model& model) {
  JSValue obj = JS_NewObject(ctx);
  SetProperty(ctx, obj, "id", NewString(ctx, model.id));
  SetProperty(ctx, obj, "name", NewString(ctx, model.name));
  JSValue elements = JS_NewArray(ctx);
  uint32_t n = 0;
  for (const auto& element : model.elements) {
    JSValue flat = JS_NewObject(ctx);
    SetProperty(ctx, flat, "id", NewString(ctx, element.id));
    SetProperty(ctx, flat, "type", NewString(ctx, element.model_element_id));
    CopyAttributes(ctx, flat, element.style);
    AppendItem(ctx, elements, n, flat);
  }
  SetProperty(ctx, obj, "elements", elements);
  return obj;
}

JSValue BuildMetamodelObject(JSContext* ctx, const Metamodel& metamodel) {
  JSValue obj = JS_NewObject(ctx);
  SetProperty(ctx, obj, "id", NewString(ctx, metamodel.id));
  SetProperty(ctx, obj, "name", NewString(ctx, metamodel.name));
  return obj;
}

static const Model* AttachedModel(JSContext* ctx) {
  const ScriptContext* sandbox = static_cast<const ScriptContext*>(JS_GetContextOpaque(ctx));
  return sandbox == nullptr ? nullptr : sandbox->AttachedModel();
}

static JSValue FindElementById(JSContext* ctx, JSValueConst this_val, int argc,
                               JSValueConst* argv) {
  const Model* model = AttachedModel(ctx);
  if (model == nullptr || argc < 1) {
    return JS_UNDEFINED;
  }
  const ModelElement* found = model->FindElement(ScriptToString(ctx, argv[0]));
  if (found == nullptr) {
    return JS_UNDEFINED;
  }
  return ElementToScript(ctx, *found);
}

static JSValue FindElementsByType(JSContext* ctx, JSValueConst this_val, int argc,
                                  JSValueConst* argv) {
  JSValue found = JS_NewArray(ctx);
  const Model* model = AttachedModel(ctx);
  if (model == nullptr || argc < 1) {
    return found;
  }
  std::string class_id = ScriptToString(ctx, argv[0]);
  uint32_t n = 0;
  for (const auto& e : model->elements) {
    if (e.model_element_id == class_id) {
      AppendItem(ctx, found, n, ElementToScript(ctx, e));
    }
  }
  return found;
}

static bool IsScriptName(const std::string& s) {
  static const std::unordered_set<std::string> kReserved = {
      "await",     "break",    "case",       "catch",     "class",     "const",
      "continue",  "debugger", "default",    "delete",    "do",        "else",
      "enum",      "export",   "extends",    "false",     "finally",   "for",
      "function",  "if",       "implements", "import",    "in",        "instanceof",
      "interface", "let",      "new",        "null",      "package",   "private",
      "protected", "public",   "return",     "static",    "super",     "switch",
      "this",      "throw",    "true",       "try",       "typeof",    "var",
      "void",      "while",    "with",       "yield",     "arguments", "eval",
      "undefined", "NaN",      "Infinity"};
  return IsIdentifier(s) && kReserved.count(s) == 0;
}

static std::string SanitizeName(const std::string& name) {
  std::string safe = boost::algorithm::trim_copy(name);
  for (auto& c : safe) {
    if (!(isalnum(static_cast<unsigned char>(c)) || c == '_')) {
      c = '_';
    }
  }
  return safe;
}

void BuildSandbox(const ModelElement& element, const Model& model, const Metamodel& metamodel,
                  ScriptContext& sandbox, bool trace) {
  JSContext* ctx = sandbox.Context();
  if (nullptr == ctx) {
    MTEXPR_ERROR("Sandbox for element {} built on an uninitialized script context", element.id);
    return;
  }
  sandbox.AttachModel(&model);
  sandbox.Bind("self", BuildSelf(ctx, element, model));
  sandbox.Bind("model", BuildModelObject(ctx, model));
  sandbox.Bind("metamodel", BuildMetamodelObject(ctx, metamodel));
  {
    ScopedJSValue global(ctx, JS_GetGlobalObject(ctx));
    for (const char* name : kStandardGlobals) {
      sandbox.Bind(name, JS_GetPropertyStr(ctx, global.Get(), name));
    }
  }
  sandbox.Bind("findElementById", JS_NewCFunction(ctx, FindElementById, "findElementById", 1));
  sandbox.Bind("findElementsByType",
               JS_NewCFunction(ctx, FindElementsByType, "findElementsByType", 1));

  const MetaClass* cls = metamodel.FindClass(element.model_element_id);
  if (cls != nullptr) {
    std::string alias = boost::algorithm::to_lower_copy(cls->name);
    if (IsScriptName(alias)) {
      sandbox.Bind(alias, JS_DupValue(ctx, sandbox.Binding("self")));
    } else {
      MTEXPR_DEBUG("Metaclass name '{}' is not usable as a script name", cls->name);
    }
  }

  for (const auto& e : model.elements) {
    const Value* name = FindAttribute(e.style, "name");
    const std::string* text = name ? std::get_if<std::string>(name) : nullptr;
    if (text == nullptr) {
      continue;
    }
    std::string safe = SanitizeName(*text);
    if (!IsScriptName(safe) || sandbox.IsBound(safe)) {
      continue;
    }
    sandbox.Bind(safe, ElementToScript(ctx, e));
  }

  if (trace) {
    MTEXPR_INFO("Sandbox for element {} ({}): {}", element.id, element.model_element_id,
                boost::algorithm::join(sandbox.Names(), ", "));
  }
}

}  // namespace mtexpr
