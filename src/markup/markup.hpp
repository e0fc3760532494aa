#pragma once

// Umbrella header for the markup library.

#include "FormatArgs.hpp"
#include "HtmlRenderable.hpp"
#include "Markup.hpp"
#include "Value.hpp"
#include "errors.hpp"
#include "escape.hpp"
#include "exports.hpp"
