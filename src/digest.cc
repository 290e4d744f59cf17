/* Copyright 2024 Joao Eduardo Luis <joao@1e3ms.io>
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 */

#include "digest.hh"

#include "errors.hh"
#include "utils.hh"

namespace gridfs {

md5_digest::md5_digest() : _ctx(EVP_MD_CTX_new()) {
  if (!_ctx) {
    throw gridfs_error("unable to allocate md5 context");
  }
  if (EVP_DigestInit_ex(_ctx.get(), EVP_md5(), nullptr) != 1) {
    throw gridfs_error("unable to initialize md5 digest");
  }
}

void md5_digest::update(const char* data, size_t len) {
  if (!_ctx) {
    throw gridfs_error("md5 digest already finished");
  }
  if (EVP_DigestUpdate(_ctx.get(), data, len) != 1) {
    throw gridfs_error("unable to update md5 digest");
  }
}

std::string md5_digest::finish() {
  if (!_ctx) {
    throw gridfs_error("md5 digest already finished");
  }
  unsigned char out[EVP_MAX_MD_SIZE];
  unsigned int out_len = 0;
  if (EVP_DigestFinal_ex(_ctx.get(), out, &out_len) != 1) {
    throw gridfs_error("unable to finalize md5 digest");
  }
  _ctx.reset();
  return to_hex(out, out_len);
}

}  // namespace gridfs
