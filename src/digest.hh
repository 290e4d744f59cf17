/* Copyright 2024 Joao Eduardo Luis <joao@1e3ms.io>
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 */

#pragma once

#include <openssl/evp.h>

#include <cstddef>
#include <memory>
#include <string>

namespace gridfs {

// Incremental MD5 over an upload's bytes.
class md5_digest {
  struct ctx_deleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
  };

  std::unique_ptr<EVP_MD_CTX, ctx_deleter> _ctx;

 public:
  // throws gridfs_error if the digest can't be set up.
  md5_digest();

  void update(const char* data, size_t len);

  // Lowercase hex digest. The object can't be updated afterwards.
  std::string finish();
};

}  // namespace gridfs
