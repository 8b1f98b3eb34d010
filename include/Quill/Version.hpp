// =================================================================
// include/Quill/Version.hpp
// =================================================================

#pragma once

#ifndef QUILL_VERSION
#define QUILL_VERSION "0.4.0"
#endif
