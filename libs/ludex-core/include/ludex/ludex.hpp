#pragma once

/**
@file
@brief The entrypoint of the Ludex core library. Includes everything a front end needs to catalog and launch games.
*/

#include <ludex/version.hpp>

#include <ludex/library/library.hpp>

#include <ludex/emu/emulator_detector.hpp>

#include <ludex/catalog/platform.hpp>
#include <ludex/core/identity.hpp>

/**
@namespace ludex
@brief Core library namespace.
*/

/**
@namespace ludex::emu
@brief Emulator profiles, registry and detection.
*/

/**
@namespace ludex::launch
@brief Launch resolution and process spawning.
*/

/**
@namespace util
@brief Utility functions shared by the library and its front ends.
*/
