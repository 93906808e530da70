#pragma once

// Pulsenet Network - Main Include
// Include this header to use the node network simulation

#include <pulsenet/network/audio_drive.h>
#include <pulsenet/network/node.h>
#include <pulsenet/network/edge.h>
#include <pulsenet/network/spatial_grid.h>
#include <pulsenet/network/spatial_network.h>
