// Copyright (c) 2021, Tencent Inc.
// All rights reserved.
#pragma once

#include <stdint.h>
#include <chrono>
#include <string>
#include <utility>
#include <vector>
#include "mtexpr/model.h"
#include "quickjs.h"

namespace mtexpr {

struct ScriptLimits {
  int64_t timeout_ms = 1000;
  int64_t memory_limit = 64 * 1024 * 1024;
  int64_t max_stack_size = 512 * 1024;
};

// Frees the held value on scope exit.
class ScopedJSValue {
 public:
  ScopedJSValue(JSContext* ctx, JSValue v) : ctx_(ctx), v_(v) {}
  ~ScopedJSValue() { JS_FreeValue(ctx_, v_); }
  ScopedJSValue(const ScopedJSValue&) = delete;
  ScopedJSValue& operator=(const ScopedJSValue&) = delete;

  JSValueConst Get() const { return v_; }
  JSValue Release() {
    JSValue v = v_;
    v_ = JS_UNDEFINED;
    return v;
  }

 private:
  JSContext* ctx_;
  JSValue v_;
};

// `String(v)`, empty when the conversion throws.
std::string ScriptToString(JSContext* ctx, JSValueConst v);

/**
 * A QuickJS runtime and context restricted to the constraint globals: Math, Date, JSON,
 * String, Number, Array, Object, Boolean, RegExp, the Error constructors, parseInt,
 * parseFloat, isNaN, isFinite, the URI functions and console. Arrays carry the OCL
 * collection operations. Memory, native stack and wall time are bounded by ScriptLimits.
 *
 * The bindings are the parameter list of compiled scripts, in the order they were bound.
 * One context serves one thread.
 */
class ScriptContext {
 public:
  explicit ScriptContext(const ScriptLimits& limits = ScriptLimits());
  ~ScriptContext();
  ScriptContext(const ScriptContext&) = delete;
  ScriptContext& operator=(const ScriptContext&) = delete;

  // MTEXPR_OK or MTEXPR_ERR_ENGINE_INIT.
  int Init(std::string& error);

  // Takes ownership of `v`. Binding a bound name replaces its value in place.
  void Bind(const std::string& name, JSValue v);
  bool IsBound(const std::string& name) const;
  // Borrowed, JS_UNDEFINED when not bound.
  JSValueConst Binding(const std::string& name) const;
  std::vector<std::string> Names() const;

  /**
   * Compiles `body` as the body of a strict function over the bound names. With
   * `compile_only` nothing runs and `fn` stays undefined. Returns MTEXPR_OK,
   * MTEXPR_ERR_UNEXPECTED_EOF when the parser ran past the end of `body`, or
   * MTEXPR_ERR_SYNTAX, with the engine message.
   */
  int Compile(const std::string& body, bool compile_only, JSValue& fn, std::string& error);
  /**
   * Calls `fn` with the bound values as positional arguments and restarts the time limit.
   * The caller frees `result`. Returns MTEXPR_OK, MTEXPR_ERR_TIMEOUT or MTEXPR_ERR_RUNTIME
   * with the message of the thrown value.
   */
  int Call(JSValueConst fn, JSValue& result, std::string& error);

  void AttachModel(const Model* model) { model_ = model; }
  const Model* AttachedModel() const { return model_; }
  JSContext* Context() const { return ctx_; }
  const ScriptLimits& Limits() const { return limits_; }

 private:
  static int OnInterrupt(JSRuntime* rt, void* opaque);
  int RestrictGlobals(std::string& error);
  // Message of the pending exception, `message` of error objects.
  std::string TakeException(int* line = nullptr);
  void ArmDeadline();

  ScriptLimits limits_;
  JSRuntime* rt_ = nullptr;
  JSContext* ctx_ = nullptr;
  std::vector<std::pair<std::string, JSValue>> bindings_;
  const Model* model_ = nullptr;
  std::chrono::steady_clock::time_point deadline_;
  bool timed_out_ = false;
};

// `{id, name?, type?, modelElementId, style, references}` as stored in the model.
JSValue ElementToScript(JSContext* ctx, const ModelElement& element);

// Style entries plus `id` and `type` (the metaclass id).
JSValue ElementView(JSContext* ctx, const ModelElement& element);

/**
 * The `self` object of a constraint run: the element view with each set reference replaced by
 * the view of its target, or an array of views for multi-valued references. Targets missing
 * from the model are dropped.
 */
JSValue BuildSelf(JSContext* ctx, const ModelElement& element, const Model& model);

JSValue BuildModelObject(JSContext* ctx, const Model& model);
JSValue BuildMetamodelObject(JSContext* ctx, const Metamodel& metamodel);

/**
 * Binds the names visible to a constraint script, in parameter order:
 *   self, model, metamodel, the standard globals, findElementById, findElementsByType,
 *   the lowercased metaclass name of the element (an alias of self), then one binding per
 *   model element whose trimmed style name, with every character outside [A-Za-z0-9_]
 *   replaced by '_', is an identifier not bound yet.
 * `model` must outlive every run in `sandbox`.
 */
void BuildSandbox(const ModelElement& element, const Model& model, const Metamodel& metamodel,
                  ScriptContext& sandbox, bool trace = false);

}  // namespace mtexpr
