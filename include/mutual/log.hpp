#pragma once

#include <mutual/log/log.hpp>
