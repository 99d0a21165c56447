#ifndef ZKGUEST_PRECOMPILED_H
#define ZKGUEST_PRECOMPILED_H

#include <errno.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/types.h>
#include <unistd.h>

#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include <openssl/bn.h>
#include <openssl/crypto.h>
#include <openssl/err.h>

#endif  // ZKGUEST_PRECOMPILED_H
