#include "sandbox/runner.hpp"

#include <fcntl.h>
#include <unistd.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <memory>
#include <new>
#include <string>
#include <vector>

#include <capnp/blob.h>
#include <capnp/message.h>
#include <capnp/serialize.h>
#include <kj/debug.h>

#include "capnp/outcome.capnp.h"
#include "sandbox/limiter.hpp"
#include "sandbox/sandbox.hpp"
#include "sandbox/source.hpp"
#include "script/context.hpp"
#include "script/ops.hpp"
#include "script/surface.hpp"
#include "util/flags.hpp"
#include "util/misc.hpp"

namespace sandbox {

namespace {
static const constexpr uint64_t kMaxOutcomeBytes = 16 * 1024 * 1024;
static const constexpr int kUnitWriteFailed = 3;

std::atomic<uint64_t> num_runs{0};
std::atomic<uint64_t> num_completed{0};
std::atomic<uint64_t> num_failed{0};
std::atomic<uint64_t> num_timed_out{0};

capnp::Text::Reader ToText(const std::string& s) {
  return capnp::Text::Reader(s.c_str(), s.size());
}

/*
 * Execution unit side
 */

void BuildImage(const script::Surface& surface,
                capnproto::Completed::Builder completed) {
  std::string png;
  try {
    png = surface.EncodePng();
  } catch (const std::bad_alloc&) {
    completed.setImageTooLarge(true);
    return;
  }
  if (png.size() > Flags::max_artifact_bytes) {
    completed.setImageTooLarge(true);
    return;
  }
  completed.setHasImage(true);
  auto image = completed.initImage();
  image.setWidth(surface.Width());
  image.setHeight(surface.Height());
  image.setPng(kj::arrayPtr(reinterpret_cast<const kj::byte*>(png.data()),
                            png.size()));
}

// Error arguments share the display limit. Arguments past it are dropped.
std::vector<std::string> TruncateArgs(const std::vector<std::string>& args) {
  std::vector<std::string> out;
  size_t left = Flags::max_text_chars;
  for (const std::string& arg : args) {
    if (left == 0) break;
    bool truncated = false;
    out.push_back(util::TruncateUtf8(arg, left, &truncated));
    if (truncated) break;
    left -= static_cast<size_t>(script::CodePointCount(out.back()));
  }
  return out;
}

// Text and errors are cut to the display limit here, so that what travels
// through the pipe stays bounded.
void BuildOutcome(const script::Outcome& outcome,
                  capnproto::Outcome::Builder builder) {
  builder.setDurationNanos(outcome.duration_nanos);
  if (!outcome.completed) {
    auto failure = builder.initFailed();
    failure.setKind(
        ToText(util::TruncateUtf8(outcome.error_kind, Flags::max_text_chars)));
    std::vector<std::string> error_args = TruncateArgs(outcome.error_args);
    auto args = failure.initArgs(error_args.size());
    for (size_t i = 0; i < error_args.size(); i++) {
      args.set(i, ToText(error_args[i]));
    }
    return;
  }
  auto completed = builder.initCompleted();
  const script::Completion& completion = outcome.completion;
  if (completion.has_text) {
    bool truncated = false;
    completed.setHasText(true);
    std::string text = util::TruncateUtf8(completion.text,
                                          Flags::max_text_chars, &truncated);
    completed.setText(ToText(text));
    completed.setTextTruncated(truncated);
  }
  if (completion.image) BuildImage(*completion.image, completed);
}

int RunUnit(const std::string& source, int outcome_fd) {
  uint64_t seed =
      std::chrono::steady_clock::now().time_since_epoch().count() ^ getpid();
  script::Outcome outcome = script::RunSnippet(source, seed);
  capnp::MallocMessageBuilder message;
  BuildOutcome(outcome, message.initRoot<capnproto::Outcome>());
  KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
                capnp::writeMessageToFd(outcome_fd, message);
              })) {
    return kUnitWriteFailed;
  }
  return 0;
}

/*
 * Host side
 */

// Everything a pending run owns. Members are destroyed bottom-up, so the
// unit is reaped before its sandbox goes away.
struct Execution {
  std::unique_ptr<Sandbox> sandbox;
  kj::Own<Guard> guard;
  kj::Own<kj::AsyncInputStream> outcome;
};

SandboxResult Failure(const std::string& kind, const std::string& message) {
  SandboxResult result;
  result.status = SandboxResult::Status::FAILED;
  result.exception.kind = kind;
  result.exception.args.push_back(message);
  return result;
}

SandboxResult UnitFailure(const std::string& message) {
  KJ_LOG(WARNING, "Execution unit failed", message);
  return Failure("SandboxError", message);
}

SandboxResult TimedOut(int64_t budget_millis) {
  SandboxResult result;
  result.status = SandboxResult::Status::TIMED_OUT;
  result.duration_nanos = budget_millis * 1000 * 1000;
  result.exception.kind = "TimeoutError";
  result.exception.args.push_back("execution exceeded " +
                                  std::to_string(budget_millis) + " ms");
  return result;
}

SandboxResult FromCapnp(capnproto::Outcome::Reader outcome) {
  SandboxResult result;
  result.duration_nanos = outcome.getDurationNanos();
  switch (outcome.which()) {
    case capnproto::Outcome::COMPLETED: {
      auto completed = outcome.getCompleted();
      result.status = SandboxResult::Status::COMPLETED;
      result.has_text = completed.getHasText();
      auto text = completed.getText();
      result.text.assign(text.begin(), text.size());
      result.text_truncated = completed.getTextTruncated();
      result.has_image = completed.getHasImage();
      if (result.has_image) {
        auto image = completed.getImage();
        auto png = image.getPng();
        result.image.width = image.getWidth();
        result.image.height = image.getHeight();
        result.image.png.assign(reinterpret_cast<const char*>(png.begin()),
                                png.size());
      }
      result.image_too_large = completed.getImageTooLarge();
      break;
    }
    case capnproto::Outcome::FAILED: {
      auto failed = outcome.getFailed();
      result.status = SandboxResult::Status::FAILED;
      result.exception.kind = failed.getKind().cStr();
      for (auto arg : failed.getArgs()) {
        result.exception.args.emplace_back(arg.begin(), arg.size());
      }
      break;
    }
  }
  return result;
}

SandboxResult Decode(kj::ArrayPtr<const kj::byte> data) {
  if (data.size() == 0 || data.size() % sizeof(capnp::word) != 0) {
    return UnitFailure("malformed outcome of " + std::to_string(data.size()) +
                       " bytes");
  }
  // The reader needs word-aligned memory.
  auto words = kj::heapArray<capnp::word>(data.size() / sizeof(capnp::word));
  memcpy(words.begin(), data.begin(), data.size());
  SandboxResult result;
  KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
                capnp::FlatArrayMessageReader reader(words);
                result = FromCapnp(reader.getRoot<capnproto::Outcome>());
              })) {
    return UnitFailure(std::string("malformed outcome: ") +
                       exception->getDescription().cStr());
  }
  return result;
}

}  // namespace

SandboxResult Interpret(const Received& received, const ExecutionInfo& info,
                        int64_t budget_millis) {
  if (received.expired || info.signal == SIGXCPU) {
    return TimedOut(budget_millis);
  }
  if (info.signal == SIGSYS) {
    return Failure("CapabilityError", "forbidden system call");
  }
  // The host kills a unit whose outcome it could not read.
  if (!received.error.empty()) {
    return UnitFailure("cannot read outcome: " + received.error);
  }
  if (info.signal != 0) {
    return UnitFailure("execution unit killed by signal " +
                       std::to_string(info.signal) + " (" + info.message +
                       ")");
  }
  if (info.status_code != 0) {
    return UnitFailure("execution unit exited with status " +
                       std::to_string(info.status_code));
  }
  return Decode(received.data);
}

namespace {
SandboxResult Finish(SandboxResult result) {
  switch (result.status) {
    case SandboxResult::Status::COMPLETED:
      num_completed++;
      break;
    case SandboxResult::Status::FAILED:
      num_failed++;
      break;
    case SandboxResult::Status::TIMED_OUT:
      num_timed_out++;
      break;
  }
  KJ_LOG(INFO, "Run finished", StatusName(result.status),
         result.duration_nanos, result.exception.kind);
  return result;
}
}  // namespace

const char* StatusName(SandboxResult::Status status) {
  switch (status) {
    case SandboxResult::Status::COMPLETED:
      return "COMPLETED";
    case SandboxResult::Status::FAILED:
      return "FAILED";
    case SandboxResult::Status::TIMED_OUT:
      return "TIMED_OUT";
  }
  KJ_UNREACHABLE;
}

kj::Promise<SandboxResult> Runner::Execute(SandboxRequest request) {
  KJ_REQUIRE(request.time_budget_millis > 0, request.time_budget_millis,
             "Invalid time budget");
  std::string source = NormalizeSource(request.source);
  KJ_REQUIRE(!source.empty(), "Empty snippet");
  int64_t budget_millis = request.time_budget_millis;
  num_runs++;

  int outcome_pipe[2];
  if (pipe2(outcome_pipe, O_CLOEXEC) == -1) {
    return Finish(UnitFailure(std::string("pipe2: ") + strerror(errno)));
  }
  kj::AutoCloseFd read_end(outcome_pipe[0]);
  kj::AutoCloseFd write_end(outcome_pipe[1]);

  auto execution = kj::heap<Execution>();
  execution->sandbox = Sandbox::Create();
  if (!execution->sandbox) {
    return Finish(UnitFailure("no sandbox available"));
  }
  ExecutionOptions options = LimitsFor(budget_millis);
  options.inherited_fds.push_back(write_end.get());
  int outcome_fd = write_end.get();
  std::string error_msg;
  bool started = execution->sandbox->Start(
      options, [&source, outcome_fd]() { return RunUnit(source, outcome_fd); },
      &error_msg);
  // Only the unit may hold the write end, or EOF would never come.
  write_end = nullptr;
  if (!started) {
    return Finish(UnitFailure("cannot start execution unit: " + error_msg));
  }

  execution->outcome = provider_.wrapInputFd(
      read_end.releaseFd(), kj::LowLevelAsyncIoProvider::TAKE_OWNERSHIP |
                                kj::LowLevelAsyncIoProvider::ALREADY_CLOEXEC);
  execution->guard = Enforce(execution->sandbox.get(), &timer_, budget_millis);

  auto received =
      execution->outcome->readAllBytes(kMaxOutcomeBytes)
          .then(
              [](kj::Array<kj::byte>&& data) {
                Received r;
                r.data = kj::mv(data);
                return r;
              },
              [](kj::Exception&& exception) {
                Received r;
                r.error = exception.getDescription().cStr();
                return r;
              });
  auto expired = execution->guard->Expired().then([]() {
    Received r;
    r.expired = true;
    return r;
  });
  return received.exclusiveJoin(kj::mv(expired))
      .then([execution = kj::mv(execution),
             budget_millis](Received&& received) mutable {
        // A unit whose outcome was not read to the end may be blocked on
        // the pipe, and would never exit by itself.
        const ExecutionInfo& info = received.error.empty()
                                        ? execution->guard->Release()
                                        : execution->guard->Abort();
        return Finish(Interpret(received, info, budget_millis));
      });
}

Runner::Stats Runner::GetStats() {
  Stats stats;
  stats.runs = num_runs;
  stats.completed = num_completed;
  stats.failed = num_failed;
  stats.timed_out = num_timed_out;
  return stats;
}

SandboxResult Execute(const std::string& source, int64_t time_budget_millis) {
  auto io = kj::setupAsyncIo();
  Runner runner(&io.provider->getTimer(), io.lowLevelProvider.get());
  SandboxRequest request;
  request.source = source;
  request.time_budget_millis = time_budget_millis;
  return runner.Execute(kj::mv(request)).wait(io.waitScope);
}

}  // namespace sandbox
