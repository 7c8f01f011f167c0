#pragma once

#include "layerkit/culture.hpp"
#include "layerkit/descriptor_registry.hpp"
#include "layerkit/elevation.hpp"
#include "layerkit/elevation_converter.hpp"
#include "layerkit/errors.hpp"
#include "layerkit/extent.hpp"
#include "layerkit/feature_set.hpp"
#include "layerkit/instance_descriptor.hpp"
#include "layerkit/layer.hpp"
#include "layerkit/layer_configurator.hpp"
#include "layerkit/layer_manager.hpp"
#include "layerkit/point_layer.hpp"
#include "layerkit/point_scheme.hpp"
#include "layerkit/representation.hpp"
#include "layerkit/types.hpp"

namespace lk = layerkit;
