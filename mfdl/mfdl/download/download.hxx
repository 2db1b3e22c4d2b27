#pragma once

#include <mfdl/download/download-types.hxx>
#include <mfdl/download/download-job.hxx>
#include <mfdl/download/download-retry.hxx>
#include <mfdl/download/download-aggregate.hxx>
#include <mfdl/download/download-semaphore.hxx>
#include <mfdl/download/download-task.hxx>
#include <mfdl/download/download-probe.hxx>
#include <mfdl/download/download-engine.hxx>
#include <mfdl/download/download-manager.hxx>
