#pragma once

#include "ivy/di/container.hpp"
#include "ivy/di/container_config.hpp"
#include "ivy/di/exceptions.hpp"
#include "ivy/di/interceptor.hpp"
#include "ivy/di/lifetime.hpp"
#include "ivy/di/lifetime_scope.hpp"
#include "ivy/di/module.hpp"
#include "ivy/di/registration.hpp"
#include "ivy/di/registration_store.hpp"
#include "ivy/di/resolution_context.hpp"
#include "ivy/di/service_key.hpp"
#include "ivy/di/type_builder.hpp"
#include "ivy/di/type_info.hpp"
#include "ivy/di/type_registry.hpp"
