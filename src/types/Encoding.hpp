#pragma once

// How a raw byte stream maps to characters on load and store.
//   LATIN1 → one byte per character, non-ASCII data written as \uXXXX
//   UTF8   → multi-byte text, non-ASCII data written as-is
enum class Encoding {LATIN1, UTF8};
