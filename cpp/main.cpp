#include "client/main.hpp"
#include "server/main.hpp"
#include "util/log_manager.hpp"
#include "util/version.hpp"
#include "worker/main.hpp"

class CodeBoxMain {
 public:
  // NOLINTNEXTLINE(google-runtime-references)
  explicit CodeBoxMain(kj::ProcessContext& context)
      : context(context), sm(context), wm(&context), cm(&context) {
    util::InstallCrashHandler();
  }
  kj::MainFunc getMain() {
    title_ = "CodeBox (" + util::version + ")";
    return kj::MainBuilder(context, title_,
                           "Compiles and runs untrusted sources in containers")
        .addSubCommand("server", KJ_BIND_METHOD(sm, getMain), "run the server")
        .addSubCommand("run", KJ_BIND_METHOD(wm, getMain),
                       "run a single file locally")
        .addSubCommand("client", KJ_BIND_METHOD(cm, getMain),
                       "submit a file to a server")
        .build();
  }

 private:
  kj::ProcessContext& context;
  std::string title_;
  server::Main sm;
  worker::Main wm;
  client::Main cm;
};

KJ_MAIN(CodeBoxMain);
