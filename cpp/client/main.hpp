#ifndef CLIENT_MAIN_HPP
#define CLIENT_MAIN_HPP
#include <kj/main.h>

#include <string>

namespace client {

// Submits a source file to a server and waits for its result.
class Main {
 public:
  explicit Main(kj::ProcessContext* context) : context(*context) {}
  kj::MainBuilder::Validity SetFile(kj::StringPtr file);
  kj::MainBuilder::Validity Run();
  kj::MainFunc getMain();

 private:
  kj::ProcessContext& context;
  std::string title_;
  std::string file_;
  std::string job_id_;
};
}  // namespace client
#endif
