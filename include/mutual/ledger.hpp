#pragma once

#include <mutual/ledger/administration.hpp>
#include <mutual/ledger/claims.hpp>
#include <mutual/ledger/codec.hpp>
#include <mutual/ledger/compliance.hpp>
#include <mutual/ledger/disputes.hpp>
#include <mutual/ledger/error.hpp>
#include <mutual/ledger/governance.hpp>
#include <mutual/ledger/guard.hpp>
#include <mutual/ledger/instruction.hpp>
#include <mutual/ledger/membership.hpp>
#include <mutual/ledger/processor.hpp>
#include <mutual/ledger/treasury.hpp>
#include <mutual/ledger/types.hpp>
