#include "client/main.hpp"

#include <iostream>

#include <capnp/ez-rpc.h>
#include <kj/async-io.h>
#include <kj/timer.h>

#include "capnp/codebox.capnp.h"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/log_manager.hpp"
#include "util/misc.hpp"
#include "util/version.hpp"

namespace client {
namespace {
const constexpr int64_t kPollIntervalMillis = 200;
}  // namespace

kj::MainBuilder::Validity Main::SetFile(kj::StringPtr file) {
  if (!util::File::IsRegular(file.cStr())) return "No such file";
  file_ = file.cStr();
  return true;
}

kj::MainBuilder::Validity Main::Run() {
  util::LogManager log_manager(&context);
  std::string source = util::File::ReadString(file_);

  capnp::EzRpcClient client(Flags::server, Flags::port);
  auto& wait_scope = client.getWaitScope();
  kj::Timer& timer = client.getIoProvider().getTimer();
  auto codebox = client.getMain<capnproto::CodeBox>();

  auto submit = codebox.submitRequest();
  submit.setCode(capnp::Text::Reader(source.data(), source.size()));
  submit.setJobId(job_id_.c_str());
  auto submitted = submit.send().wait(wait_scope);
  std::string id(submitted.getJobId().cStr());
  KJ_LOG(INFO, "Job submitted", id);

  while (true) {
    auto request = codebox.resultRequest();
    request.setJobId(id.c_str());
    auto response = request.send().wait(wait_scope);
    auto result = response.getResult();
    if (result.getStatus() == capnproto::JobStatus::COMPLETED ||
        result.getStatus() == capnproto::JobStatus::FAILED) {
      std::cout << result.getOutput().cStr() << std::flush;
      if (result.getStatus() == capnproto::JobStatus::FAILED) {
        return "The server could not run the job";
      }
      if (!result.getSuccess()) return "Execution failed";
      return true;
    }
    timer.afterDelay(kPollIntervalMillis * kj::MILLISECONDS).wait(wait_scope);
  }
}

kj::MainFunc Main::getMain() {
  title_ = "CodeBox Client (" + util::version + ")";
  return kj::MainBuilder(context, title_,
                         "Submits a source file to a server and prints the "
                         "output of its execution")
      .addOptionWithArg({'L', "logfile"}, util::setString(&Flags::log_file),
                        "<LOGFILE>", "Path where the log file should be stored")
      .addOptionWithArg({'s', "server"}, util::setString(&Flags::server),
                        "<ADDRESS>", "Address to connect to")
      .addOptionWithArg({'p', "port"}, util::setInt(&Flags::port), "<PORT>",
                        "Port to connect to")
      .addOptionWithArg({'j', "job-id"}, util::setString(&job_id_), "<ID>",
                        "Id of the job, chosen by the server if missing")
      .expectArg("<FILE>", KJ_BIND_METHOD(*this, SetFile))
      .callAfterParsing(KJ_BIND_METHOD(*this, Run))
      .build();
}
}  // namespace client
