#ifndef SERVER_SERVER_HPP
#define SERVER_SERVER_HPP

#include "capnp/codebox.capnp.h"
#include "core/job_store.hpp"
#include "server/dispatcher.hpp"

namespace server {

// Implementation of the submission interface.
class Server : public capnproto::CodeBox::Server {
 public:
  Server(core::MemoryJobStore* store, Dispatcher* dispatcher)
      : store_(*store), dispatcher_(*dispatcher) {}

  kj::Promise<void> submit(SubmitContext context) override;
  kj::Promise<void> result(ResultContext context) override;

 private:
  core::MemoryJobStore& store_;
  Dispatcher& dispatcher_;
};

}  // namespace server

#endif
