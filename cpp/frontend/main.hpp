#ifndef FRONTEND_MAIN_HPP
#define FRONTEND_MAIN_HPP
#include <kj/main.h>
#include <cstdint>
#include <string>

namespace frontend {

// The "run" and "capabilities" commands.
class Main {
 public:
  explicit Main(kj::ProcessContext* context) : context(*context) {}
  kj::MainFunc getRunMain();
  kj::MainFunc getCapabilitiesMain();

 private:
  kj::MainBuilder::Validity SetSourceFile(kj::StringPtr path);
  kj::MainBuilder::Validity Run();
  kj::MainBuilder::Validity Capabilities();

  kj::ProcessContext& context;
  bool privileged = false;
  int budget_millis = 0;
  std::string image_path;
  std::string source_file;
};
}  // namespace frontend
#endif
