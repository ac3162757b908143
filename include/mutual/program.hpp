#pragma once

#include <mutual/program/error.hpp>
#include <mutual/program/program.hpp>
#include <mutual/program/system_interface.hpp>
#include <mutual/program/token.hpp>
