#pragma once

// soulrelay facade
// Composes identity, authentication, reputation, marketplace and the wire dispatcher

#include "soulrelay/soulrelay.hpp"
