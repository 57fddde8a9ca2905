#pragma once

/** ids below this belong to built-in accounts */
#define IXC_ACCOUNT_ID_NON_RESERVED_START (uint64_t(0xffff)+1)

/**
 *  Bookkeeping keys in the manager namespace.  Account owned keys live in a
 *  different namespace, these can never collide with them.
 */
#define IXC_HANDLER_KEY_PREFIX   "h:"
#define IXC_NEXT_ACCOUNT_ID_KEY  "next_account_id"

#define IXC_HANDLER_ID_SEPARATOR ':'
