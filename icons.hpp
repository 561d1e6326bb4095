#ifndef ICONS_H
#define ICONS_H

#include "entry.hpp"

#include <string>

// Nerd Font glyph (with trailing space) for an entry, picked by kind and extension.
std::string icon_for(const Entry& entry);

#endif
