#pragma once
// ═══════════════════════════════════════════════════════════════════
//  formpp/formpp.h — Umbrella header for the formpp library
// ═══════════════════════════════════════════════════════════════════
//
//  #include "formpp/formpp.h"
//
//  This single include gives you:
//    • multipart::MultipartParser, multipart::Options
//    • FormRequest (lazy parsing + temp file lifetime)
//    • FormFields / FileFields / FormValue / UploadedFile, toJson()
//    • HttpError, ErrorKind
//    • console::log(), debug(), warn(), error()
//    • env::get()
//
//  The Boost.Beast adapter lives in "formpp/beast.h".
//
// ═══════════════════════════════════════════════════════════════════

// Core
#include "console.h"
#include "env.h"
#include "error.h"

// Parsing
#include "charset.h"
#include "params.h"
#include "headers.h"
#include "multipart.h"

// Request integration
#include "form_data.h"
#include "request.h"
#include "stream.h"
#include "temp_file.h"
