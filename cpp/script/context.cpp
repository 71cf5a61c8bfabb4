#include "script/context.hpp"

#include <chrono>
#include <new>
#include <stdexcept>

#include "script/error.hpp"
#include "script/interpreter.hpp"
#include "script/parser.hpp"

namespace script {

Outcome RunSnippet(const std::string& source, uint64_t seed) {
  Outcome outcome;
  auto start = std::chrono::steady_clock::now();
  auto fail = [&outcome](const ExecutionError& e) {
    outcome.completed = false;
    outcome.error_kind = e.Kind();
    outcome.error_args = e.Args();
  };
  try {
    Program program = Parse(source);
    OutputChannel output;
    Interpreter interpreter(&output, seed);
    Value trailing = interpreter.Run(program);
    outcome.completion = output.Complete(trailing);
    outcome.completed = true;
  } catch (const ExecutionError& e) {
    fail(e);
  } catch (const std::bad_alloc&) {
    fail(ExecutionError("MemoryError", ValueList{}));
  } catch (const std::length_error&) {
    fail(ExecutionError("MemoryError", ValueList{}));
  } catch (const std::exception& e) {
    // Any other failure of the interpreter itself.
    fail(ExecutionError("SystemError", e.what()));
  }
  outcome.duration_nanos =
      std::chrono::duration_cast<std::chrono::nanoseconds>(
          std::chrono::steady_clock::now() - start)
          .count();
  return outcome;
}

}  // namespace script
