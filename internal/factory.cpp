#include "factory.hpp"

#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/remote_write_server.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/ingest_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/sink/arrow_ipc_loader.hpp"
#include "internal/util/errors.hpp"

namespace tsbatch::factory {

using namespace tsbatch;

pipeline::PipelineOptions BuildPipelineOptions(const tsbatch::runtime::config::RuntimeConfig& config) {
  pipeline::PipelineOptions options;

  options.max_batch_size     = static_cast<std::size_t>(config.batching().max_batch_size());
  options.max_batch_interval = std::chrono::seconds(config.batching().max_batch_interval_seconds());

  options.staging.directory = config.staging().directory();
  if (!config.staging().file_prefix().empty()) {
    options.staging.file_prefix = config.staging().file_prefix();
  }
  options.staging.fsync = config.staging().fsync();
  if (config.staging().has_recover_on_start()) {
    options.recover_on_start = config.staging().recover_on_start();
  }
  if (config.staging().has_flush_on_shutdown()) {
    options.flush_on_shutdown = config.staging().flush_on_shutdown();
  }

  options.retry.max_retries     = config.ingestion().max_retries();
  options.retry.between_retries = std::chrono::milliseconds(config.ingestion().ms_between_retries());

  const auto& destination         = config.destination();
  options.destination.database     = destination.database();
  options.destination.table        = destination.table();
  options.destination.mapping_name = destination.mapping_name();
  if (!destination.format().empty()) {
    options.destination.format = destination.format();
  }

  return options;
}

sink::BulkLoaderPtr BuildLoader(const tsbatch::runtime::config::SinkConfig& config) {
  switch (config.sink_case()) {
    case tsbatch::runtime::config::SinkConfig::kArrowIpc:
      return std::make_shared<sink::ArrowIpcLoader>(config.arrow_ipc().root_path());
    default:
      throw util::InvalidArgument("sink: no loader configured");
  }
}

Application Build(const tsbatch::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Batching pipeline
  // ------------------------------------------------------------------
  app.pipeline = std::make_shared<pipeline::Pipeline>(BuildPipelineOptions(config), BuildLoader(config.sink()));

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.pipeline = app.pipeline;

  auto ingest_service = std::make_shared<service::IngestService>(ctx);
  auto admin_service  = std::make_shared<service::AdminService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::RemoteWriteServer>(ingest_service));
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(admin_service));

  return app;
}

} // namespace tsbatch::factory
