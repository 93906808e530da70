#pragma once

// Pulsenet - Main Include

#include <pulsenet/param.h>
#include <pulsenet/param_registry.h>
#include <pulsenet/config.h>
#include <pulsenet/frame_monitor.h>
#include <pulsenet/audio/audio.h>
#include <pulsenet/network/network.h>
