/*
 * Copyright (c) 2017-2025 [Ribose Inc](https://www.ribose.com).
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions
 * are met:
 * 1. Redistributions of source code must retain the above copyright
 *    notice, this list of conditions and the following disclaimer.
 * 2. Redistributions in binary form must reproduce the above copyright
 *    notice, this list of conditions and the following disclaimer in the
 *    documentation and/or other materials provided with the distribution.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS
 * ``AS IS'' AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED
 * TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR
 * PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDERS OR CONTRIBUTORS
 * BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
 * CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
 * SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
 * INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
 * CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
 * ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
 * POSSIBILITY OF SUCH DAMAGE.
 */

#include <string.h>
#include <algorithm>
#include <array>
#include "stream-armor.h"
#include "stream-packet.h"
#include "str-utils.h"
#include "crypto/hash.hpp"
#include "utils.h"
#include "logging.h"

#define ARMOR_DASHES "-----"
#define ARMOR_BEGIN "BEGIN "
#define ARMOR_END "END "

static const char B64_CHARS[] =
  "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

typedef struct armor_hdr_name_t {
    const char *      name;
    pgp_armored_msg_t type;
} armor_hdr_name_t;

static const armor_hdr_name_t armor_names[] = {
  {"PGP MESSAGE", PGP_ARMORED_MESSAGE},
  {"PGP PUBLIC KEY BLOCK", PGP_ARMORED_PUBLIC_KEY},
  {"PGP PUBLIC KEY", PGP_ARMORED_PUBLIC_KEY},
  {"PGP SECRET KEY BLOCK", PGP_ARMORED_SECRET_KEY},
  {"PGP SECRET KEY", PGP_ARMORED_SECRET_KEY},
  {"PGP PRIVATE KEY BLOCK", PGP_ARMORED_SECRET_KEY},
  {"PGP PRIVATE KEY", PGP_ARMORED_SECRET_KEY},
  {"PGP SIGNATURE", PGP_ARMORED_SIGNATURE},
  {"PGP SIGNED MESSAGE", PGP_ARMORED_CLEARTEXT},
};

static pgp_armored_msg_t
armor_name_type(const std::string &name)
{
    for (auto &item : armor_names) {
        if (name == item.name) {
            return item.type;
        }
    }
    return PGP_ARMORED_UNKNOWN;
}

static std::string
trim_ws(const std::string &str)
{
    size_t start = str.find_first_not_of(" \t\r");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(" \t\r");
    return str.substr(start, end - start + 1);
}

/* Locate '-----BEGIN <name>-----' inside of text, returning its offset and the name */
static size_t
find_armor_begin(const std::string &text, std::string &name)
{
    size_t pos = 0;
    while ((pos = text.find(ARMOR_DASHES ARMOR_BEGIN, pos)) != std::string::npos) {
        size_t nstart = pos + strlen(ARMOR_DASHES ARMOR_BEGIN);
        size_t nend = text.find(ARMOR_DASHES, nstart);
        size_t eol = text.find('\n', nstart);
        if ((nend != std::string::npos) && ((eol == std::string::npos) || (nend < eol))) {
            name = text.substr(nstart, nend - nstart);
            return pos;
        }
        pos = nstart;
    }
    return std::string::npos;
}

/* Armored input is always in memory, so the header is searched over all of it */
static std::string
peek_text(pgp_source_t *src)
{
    return std::string((const char *) src->data + src->pos, src_left(src));
}

bool
is_armored_source(pgp_source_t *src)
{
    std::string text = peek_text(src);
    return text.find(ARMOR_DASHES ARMOR_BEGIN "PGP ") != std::string::npos;
}

pgp_armored_msg_t
armor_guess_type(pgp_source_t *src)
{
    uint8_t ptag = 0;
    if (!src_peek_eq(src, &ptag, 1)) {
        return PGP_ARMORED_UNKNOWN;
    }
    int ptype = get_packet_type(ptag);
    if ((ptype == PGP_PKT_PUBLIC_KEY) || (ptype == PGP_PKT_PUBLIC_SUBKEY)) {
        return PGP_ARMORED_PUBLIC_KEY;
    }
    if ((ptype == PGP_PKT_SECRET_KEY) || (ptype == PGP_PKT_SECRET_SUBKEY)) {
        return PGP_ARMORED_SECRET_KEY;
    }
    if (ptype == PGP_PKT_SIGNATURE) {
        return PGP_ARMORED_SIGNATURE;
    }
    if ((ptype == PGP_PKT_PK_SESSION_KEY) || (ptype == PGP_PKT_SK_SESSION_KEY) ||
        (ptype == PGP_PKT_ONE_PASS_SIG) || (ptype == PGP_PKT_COMPRESSED) ||
        (ptype == PGP_PKT_SE_DATA) || (ptype == PGP_PKT_SE_IP_DATA) ||
        (ptype == PGP_PKT_LITDATA) || (ptype == PGP_PKT_MARKER)) {
        return PGP_ARMORED_MESSAGE;
    }
    return PGP_ARMORED_UNKNOWN;
}

pgp_armored_msg_t
armored_get_type(pgp_source_t *src)
{
    std::string name;
    if (find_armor_begin(peek_text(src), name) == std::string::npos) {
        return PGP_ARMORED_UNKNOWN;
    }
    return armor_name_type(name);
}

/* Read the next line, consuming it together with the line end */
static bool
armor_next_line(pgp_source_t *src, std::string &line)
{
    if (!src_peek_line(src, line, src_left(src))) {
        return false;
    }
    src_skip(src, line.size());
    src_skip_eol(src);
    return true;
}

static bool
is_b64_char(char ch)
{
    return ch && strchr(B64_CHARS, ch);
}

static bool
armor_read_start(pgp_source_t *src, pgp_armor_info_t &info)
{
    std::string name;
    std::string head = peek_text(src);
    size_t      pos = find_armor_begin(head, name);
    if (pos == std::string::npos) {
        KEYREG_LOG("no armor header");
        return false;
    }
    if (!trim_ws(head.substr(0, pos)).empty()) {
        KEYREG_LOG("extra data before the header line");
    }
    info.type = armor_name_type(name);
    if (info.type == PGP_ARMORED_UNKNOWN) {
        KEYREG_LOG("unknown armor header");
        return false;
    }
    info.armorhdr = ARMOR_BEGIN + name;
    src_skip(src, pos);

    std::string line;
    if (!armor_next_line(src, line)) {
        return false;
    }
    /* armor headers, up to the empty line */
    while (true) {
        if (!src_peek_line(src, line, src_left(src))) {
            KEYREG_LOG("unexpected end of armor headers");
            return false;
        }
        if (keyreg::is_blank_line(line.c_str(), line.size())) {
            return armor_next_line(src, line);
        }
        size_t colon = line.find(": ");
        if (colon == std::string::npos) {
            /* some producers omit the empty line */
            KEYREG_LOG("Warning: no empty line after the armor headers");
            return true;
        }
        std::string key = line.substr(0, colon);
        std::string value = line.substr(colon + 2);
        if (key == "Version") {
            info.version = value;
        } else if (key == "Comment") {
            info.comment = value;
        } else if (key == "Hash") {
            info.hash = value;
        } else if (key == "Charset") {
            info.charset = value;
        } else {
            KEYREG_LOG("unknown header '%s'", line.c_str());
        }
        armor_next_line(src, line);
    }
}

keyreg_result_t
dearmor_source(pgp_source_t *src, std::vector<uint8_t> &dst, pgp_armor_info_t *info)
{
    pgp_armor_info_t tmp;
    pgp_armor_info_t &ainfo = info ? *info : tmp;
    ainfo = pgp_armor_info_t();

    if (!armor_read_start(src, ainfo)) {
        KEYREG_LOG("failed to parse armor header");
        return KEYREG_ERROR_BAD_ARMOR;
    }

    std::string b64;
    std::string crc;
    std::string line;
    while (true) {
        if (!armor_next_line(src, line)) {
            KEYREG_LOG("unexpected end of armored data");
            return KEYREG_ERROR_BAD_ARMOR;
        }
        line = trim_ws(line);
        if (!line.compare(0, strlen(ARMOR_DASHES), ARMOR_DASHES)) {
            break;
        }
        if (!crc.empty()) {
            if (!line.empty()) {
                KEYREG_LOG("data after the armor checksum");
                return KEYREG_ERROR_BAD_ARMOR;
            }
            continue;
        }
        if ((line.size() == 5) && (line[0] == '=')) {
            crc = line.substr(1);
            continue;
        }
        for (char ch : line) {
            if (!is_b64_char(ch) && (ch != '=') && (ch != ' ') && (ch != '\t')) {
                KEYREG_LOG("wrong base64 character 0x%02X", (unsigned) (uint8_t) ch);
                return KEYREG_ERROR_BAD_ARMOR;
            }
            if ((ch != ' ') && (ch != '\t')) {
                b64.push_back(ch);
            }
        }
    }

    std::string trailer = ARMOR_DASHES ARMOR_END + ainfo.armorhdr.substr(strlen(ARMOR_BEGIN)) +
                          ARMOR_DASHES;
    if (line != trailer) {
        KEYREG_LOG("wrong armor trailer: %s", line.c_str());
        return KEYREG_ERROR_BAD_ARMOR;
    }

    std::vector<uint8_t> bin;
    std::vector<uint8_t> crcbin;
    try {
        bin = keyreg::base64_decode(b64);
        if (!crc.empty()) {
            crcbin = keyreg::base64_decode(crc);
        }
    } catch (const keyreg::keyreg_exception &e) {
        KEYREG_LOG("failed to decode armored data: %s", e.what());
        return KEYREG_ERROR_BAD_ARMOR;
    }

    if (!crc.empty()) {
        ainfo.has_crc = true;
        auto crc_ctx = keyreg::CRC24::create();
        crc_ctx->add(bin.data(), bin.size());
        auto calc = crc_ctx->finish();
        ainfo.crc_valid = (crcbin.size() == calc.size()) &&
                          std::equal(calc.begin(), calc.end(), crcbin.begin());
        if (!ainfo.crc_valid) {
            KEYREG_LOG("Warning: CRC mismatch");
        }
    }
    dst.insert(dst.end(), bin.begin(), bin.end());
    return KEYREG_SUCCESS;
}
