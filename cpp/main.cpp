#include "frontend/main.hpp"
#include "util/version.hpp"

class ScriptboxMain {
 public:
  // NOLINTNEXTLINE(google-runtime-references)
  explicit ScriptboxMain(kj::ProcessContext& context)
      : context(context), fm(&context) {}
  kj::MainFunc getMain() {
    static const std::string title = "Scriptbox (" + util::version + ")";
    return kj::MainBuilder(context, title.c_str(),
                           "Runs untrusted snippets in a sandbox")
        .addSubCommand("run", KJ_BIND_METHOD(fm, getRunMain), "run a snippet")
        .addSubCommand("capabilities",
                       KJ_BIND_METHOD(fm, getCapabilitiesMain),
                       "list what a snippet can use")
        .build();
  }

 private:
  kj::ProcessContext& context;
  frontend::Main fm;
};

KJ_MAIN(ScriptboxMain);
