// docgraph/syntax/java_queries.hpp - Tree-sitter query patterns for the Java grammar
#pragma once

namespace docgraph::queries
{

/// Call sites inside a method body. `@call` captures ordinary invocations
/// (`foo(1)`, `obj.foo(1)`, `Type.foo(1)`); `@ctor_call` captures explicit
/// `this(...)` delegation between constructors.
inline constexpr const char * k_call_sites = R"scm(
(method_invocation
  name: (identifier)) @call
(explicit_constructor_invocation
  constructor: (this)) @ctor_call
)scm";

inline constexpr const char * k_call_capture = "call";
inline constexpr const char * k_ctor_call_capture = "ctor_call";

}  // namespace docgraph::queries
