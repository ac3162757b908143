#pragma once

#include <mutual/protocol/account.hpp>
#include <mutual/protocol/program.hpp>
#include <mutual/protocol/transaction.hpp>
