#pragma once

// Set by CMake from project(VERSION); the fallback covers non-CMake builds.
#ifndef SLIPSORT_VERSION_STRING
#define SLIPSORT_VERSION_STRING "0.0.0-dev"
#endif
