#pragma once

#define IXC_MESSAGE_HEADER_SIZE   512
#define IXC_DATA_POINTER_SIZE     16
#define IXC_MESSAGE_POINTER_SLOTS 4

/**
 *  Stable method names of the account lifecycle messages, the selectors
 *  are derived from these with message_selector().
 */
#define IXC_CREATE_METHOD    "ixc.account.v1.create"
#define IXC_ON_CREATE_METHOD "ixc.account.v1.on_create"
