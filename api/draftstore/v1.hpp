#pragma once

// Public enum surface shared by every layer.
#include "draftstore/v1/types.pb.h"
