#pragma once

#include <mutual/host/call_stack.hpp>
#include <mutual/host/context.hpp>
#include <mutual/host/error.hpp>
#include <mutual/host/store.hpp>
