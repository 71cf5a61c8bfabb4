#include "frontend/main.hpp"

#include <unistd.h>
#include <iostream>
#include <system_error>

#include <kj/async-io.h>
#include <kj/debug.h>

#include "frontend/formatter.hpp"
#include "sandbox/runner.hpp"
#include "sandbox/source.hpp"
#include "script/capabilities.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/log_manager.hpp"
#include "util/misc.hpp"
#include "util/version.hpp"

namespace frontend {

namespace {
static const constexpr uint64_t kMaxSourceBytes = 1024 * 1024;

// MainBuilder keeps a pointer to it.
const std::string& Title() {
  static const std::string title = "Scriptbox (" + util::version + ")";
  return title;
}

void Print(const Message& message) {
  std::cout << message.title << "\n" << message.body << std::endl;
  if (!message.notice.empty()) std::cout << message.notice << std::endl;
}
}  // namespace

kj::MainBuilder::Validity Main::SetSourceFile(kj::StringPtr path) {
  source_file = path.cStr();
  return true;
}

kj::MainBuilder::Validity Main::Run() {
  util::LogManager log_manager(context);
  if (budget_millis < 0) return kj::str("Invalid time budget");
  int64_t budget = budget_millis;
  if (budget == 0) {
    budget = privileged ? Flags::privileged_budget_millis
                        : Flags::default_budget_millis;
  }

  std::string source;
  try {
    source = source_file.empty()
                 ? util::File::ReadFd(STDIN_FILENO, kMaxSourceBytes)
                 : util::File::Read(source_file, kMaxSourceBytes);
  } catch (const std::system_error& e) {
    return kj::str("Cannot read the snippet: ", e.what());
  }
  if (sandbox::NormalizeSource(source).empty()) {
    return kj::str("Empty snippet");
  }

  auto io = kj::setupAsyncIo();
  sandbox::Runner runner(&io.provider->getTimer(), io.lowLevelProvider.get());
  sandbox::SandboxRequest request;
  request.source = std::move(source);
  request.time_budget_millis = budget;
  sandbox::SandboxResult result =
      runner.Execute(std::move(request)).wait(io.waitScope);
  Print(Render(result));

  if (result.has_image) {
    ArtifactFile artifact(Flags::temp_directory, result.image);
    if (artifact.TooLarge()) {
      std::cout << "Image cannot be sent: the image file size is >"
                << FormatBytes(Flags::max_artifact_bytes) << std::endl;
    } else if (image_path.empty()) {
      std::cout << "Image of " << result.image.width << "x"
                << result.image.height << " pixels, use -o to save it"
                << std::endl;
    } else {
      try {
        util::File::Copy(artifact.Path(), image_path);
      } catch (const std::system_error& e) {
        return kj::str("Cannot save the image: ", e.what());
      }
    }
  }
  return true;
}

kj::MainBuilder::Validity Main::Capabilities() {
  std::string listing;
  for (const script::Capability& capability : script::CapabilityIndex()) {
    listing += capability.name + ": " + capability.description + "\n";
  }
  for (const std::string& page : SplitLongMessage(listing)) {
    std::cout << page;
  }
  std::cout << std::flush;
  return true;
}

kj::MainFunc Main::getRunMain() {
  return kj::MainBuilder(context, Title().c_str(),
                         "Runs a snippet read from FILE, or from standard "
                         "input, in a sandbox and prints what it returned")
      .addOptionWithArg({'L', "logfile"}, util::setString(Flags::log_file),
                        "<LOGFILE>", "Path where the log file should be stored")
      .addOption({'v', "verbose"}, util::setBool(Flags::verbose),
                 "Log informational messages and stack traces")
      .addOption({'p', "privileged"}, util::setBool(privileged),
                 "Use the privileged time budget")
      .addOptionWithArg({'t', "time"}, util::setInt(budget_millis),
                        "<MILLIS>", "Time budget, overrides -p")
      .addOptionWithArg({'o', "image"}, util::setString(image_path),
                        "<IMAGE>", "Path where the produced image is saved")
      .addOptionWithArg({'T', "temp-dir"},
                        util::setString(Flags::temp_directory), "<DIR>",
                        "Path where images are staged")
      .addOptionWithArg({'m', "memory"}, util::setInt(Flags::memory_limit_kb),
                        "<KB>", "Memory a snippet may allocate")
      .expectOptionalArg("<FILE>", KJ_BIND_METHOD(*this, SetSourceFile))
      .callAfterParsing(KJ_BIND_METHOD(*this, Run))
      .build();
}

kj::MainFunc Main::getCapabilitiesMain() {
  return kj::MainBuilder(context, Title().c_str(),
                         "Lists every name a snippet can use")
      .callAfterParsing(KJ_BIND_METHOD(*this, Capabilities))
      .build();
}

}  // namespace frontend
