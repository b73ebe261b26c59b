// Umbrella header for the modelkit library
#pragma once

#include "mk/dictionary.h"
#include "mk/errors.h"
#include "mk/fields.h"
#include "mk/model.h"
