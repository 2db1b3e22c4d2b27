#pragma once

#include <mfdl/progress/progress-types.hxx>
#include <mfdl/progress/progress-format.hxx>
#include <mfdl/progress/progress-rate.hxx>
#include <mfdl/progress/progress-renderer.hxx>
#include <mfdl/progress/progress-manager.hxx>
