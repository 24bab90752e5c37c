#pragma once

#include <memory>

namespace tsbatch::pipeline { class Pipeline; }

namespace tsbatch::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<tsbatch::pipeline::Pipeline> pipeline;
};

}
