// Copyright (c) 2021, Tencent Inc.
// All rights reserved.
#pragma once

#define MTEXPR_OK 0
#define MTEXPR_ERR_SYNTAX 10001
#define MTEXPR_ERR_UNEXPECTED_EOF 10002
#define MTEXPR_ERR_ENGINE_INIT 10003
#define MTEXPR_ERR_RUNTIME 10006
#define MTEXPR_ERR_TIMEOUT 10007
#define MTEXPR_ERR_INVALID_JSON 10009
#define MTEXPR_ERR_INVALID_EXPR_TYPE 10010
#define MTEXPR_ERR_INVALID_OPTIONS 10011
