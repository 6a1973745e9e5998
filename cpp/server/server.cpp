#include "server/server.hpp"

#include <kj/debug.h>

#include <string>

#include "worker/validator.hpp"

namespace server {
namespace {
capnproto::JobStatus ToCapnp(core::JobStatus status) {
  switch (status) {
    case core::JobStatus::PENDING:
      return capnproto::JobStatus::PENDING;
    case core::JobStatus::RUNNING:
      return capnproto::JobStatus::RUNNING;
    case core::JobStatus::COMPLETED:
      return capnproto::JobStatus::COMPLETED;
    case core::JobStatus::FAILED:
      return capnproto::JobStatus::FAILED;
  }
  KJ_FAIL_ASSERT("Unknown job status");
}
}  // namespace

kj::Promise<void> Server::submit(SubmitContext context) {
  kj::StringPtr param = context.getParams().getCode();
  std::string code(param.begin(), param.end());
  KJ_REQUIRE(!code.empty(), "Code must not be empty");
  KJ_REQUIRE(worker::Utf8Length(code) <= worker::kMaxCodeLength,
             "Code is too long", worker::kMaxCodeLength);
  std::string id =
      store_.Create(code, context.getParams().getJobId().cStr());
  KJ_LOG(INFO, "Job submitted", id, code.size());
  try {
    dispatcher_.Enqueue(id);
  } catch (const std::exception& e) {
    KJ_LOG(WARNING, "Could not queue job", id, e.what());
    store_.Fail(id, "server shutting down");
    throw;
  }
  context.getResults().setJobId(id.c_str());
  return kj::READY_NOW;
}

kj::Promise<void> Server::result(ResultContext context) {
  std::string id(context.getParams().getJobId().cStr());
  core::Job job;
  KJ_REQUIRE(store_.Get(id, &job), "Unknown job", id);
  auto result = context.getResults().initResult();
  result.setJobId(job.id.c_str());
  result.setStatus(ToCapnp(job.status));
  result.setSuccess(job.success);
  result.setOutput(
      capnp::Text::Reader(job.output.data(), job.output.size()));
  return kj::READY_NOW;
}

}  // namespace server
