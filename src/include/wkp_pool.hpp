#pragma once
/**
 * @file wkp_pool.hpp
 * @brief Layer 2: Worker pool orchestration built on wkp_base.
 *
 * Provides WorkerInstance and its registry, the InstanceCoordinator,
 * selection strategies, LoadBalancer, HealthMonitor, AlertChannel,
 * PoolConfig and the PoolManager facade.
 * Include this to embed a pool; PoolManager is the usual entry point.
 */
#include "wkp_base.hpp"

#include <nlohmann/json.hpp>

#include "pool/alert_channel.hpp"
#include "pool/clock.hpp"
#include "pool/health_monitor.hpp"
#include "pool/instance_coordinator.hpp"
#include "pool/instance_registry.hpp"
#include "pool/load_balancer.hpp"
#include "pool/pool_config.hpp"
#include "pool/pool_manager.hpp"
#include "pool/selection_strategy.hpp"
#include "pool/worker_instance.hpp"
