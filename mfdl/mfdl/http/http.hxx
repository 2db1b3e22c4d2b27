#pragma once

#include <mfdl/http/http-types.hxx>
#include <mfdl/http/http-url.hxx>
#include <mfdl/http/http-request.hxx>
#include <mfdl/http/http-response.hxx>
#include <mfdl/http/http-client.hxx>
