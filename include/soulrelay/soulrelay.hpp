#pragma once

#include "soulrelay/auth/session.hpp"
#include "soulrelay/auth/soul_authenticator.hpp"
#include "soulrelay/common/config.hpp"
#include "soulrelay/common/error.hpp"
#include "soulrelay/identity/key.hpp"
#include "soulrelay/identity/signer.hpp"
#include "soulrelay/identity/soul.hpp"
#include "soulrelay/identity/soul_registry.hpp"
#include "soulrelay/market/listing.hpp"
#include "soulrelay/market/marketplace.hpp"
#include "soulrelay/market/order_book.hpp"
#include "soulrelay/market/trade.hpp"
#include "soulrelay/protocol/command.hpp"
#include "soulrelay/protocol/dispatcher.hpp"
#include "soulrelay/relay.hpp"
#include "soulrelay/reputation/reputation_event.hpp"
#include "soulrelay/reputation/reputation_ledger.hpp"
#include "soulrelay/storage/file_store.hpp"
