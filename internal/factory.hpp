#pragma once

#include <grpcpp/impl/service_type.h>

#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "internal/fiscal/fiscal_scheduler.hpp"
#include "internal/integration/adapter_registry.hpp"
#include "internal/recovery/recovery_manager.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/periodic_task.hpp"

namespace resync::factory {

/*
  Application

  Owns every long-lived component of a node. Background loops are
  registered with the recovery manager and are not running until the
  caller starts them.
*/
struct Application {
  service::ServiceContext ctx;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;

  std::shared_ptr<fiscal::FiscalScheduler>    fiscal_scheduler;
  std::shared_ptr<recovery::RecoveryManager>  recovery;
  std::vector<std::shared_ptr<util::PeriodicTask>> background_tasks;

  std::shared_ptr<integration::PaymentGatewayRegistry> payment_gateways;
  std::shared_ptr<integration::OrderParserRegistry>    order_parsers;
};

/*
  Build

  Composition root: the only place that knows concrete database types,
  remote transports and which components a node role runs.
*/
Application Build(const resync::runtime::config::RuntimeConfig& config);

} // namespace resync::factory
