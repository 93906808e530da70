#pragma once

// Pulsenet Audio - Main Include
// Include this header to use the whole analysis pipeline

// Capture
#include <pulsenet/audio/sample_source.h>
#include <pulsenet/audio/audio_capture.h>

// Analysis
#include <pulsenet/audio/spectrum_analyzer.h>
#include <pulsenet/audio/signal_analyzer.h>
#include <pulsenet/audio/beat_detector.h>

// Enrichment
#include <pulsenet/audio/audio_intelligence.h>
