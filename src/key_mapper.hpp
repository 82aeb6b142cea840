#pragma once
/*
 * KeyMapper
 *
 * Purpose: normalize one curses wget_wch() result into an Input.
 * Note: pure and total; unrecognized events (resize, mouse, F-keys, ERR)
 *       become Input{} (Key::Null).
 */
#include <cwchar>
#include "types.hpp"

// `status` is the wget_wch return value (OK, KEY_CODE_YES or ERR).
Input map_key(int status, wint_t ch);
