#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"
#include "internal/pipeline/pipeline.hpp"
#include "internal/sink/bulk_loader.hpp"

namespace tsbatch::factory {

/*
  Application

  Everything the daemon keeps alive for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<tsbatch::pipeline::Pipeline>   pipeline;
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

tsbatch::pipeline::PipelineOptions BuildPipelineOptions(const tsbatch::runtime::config::RuntimeConfig& config);

tsbatch::sink::BulkLoaderPtr BuildLoader(const tsbatch::runtime::config::SinkConfig& config);

/*
  Build

  Composition root: the only place that knows the concrete loader type.
  The returned pipeline is not started.
*/
Application Build(const tsbatch::runtime::config::RuntimeConfig& config);

} // namespace tsbatch::factory
