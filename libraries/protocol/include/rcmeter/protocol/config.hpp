#pragma once

#ifdef IS_TEST_NET
#define RCMETER_ADDRESS_PREFIX                  "TST"
#else
#define RCMETER_ADDRESS_PREFIX                  "STM"
#endif

#define RCMETER_BLOCK_INTERVAL                  3

#define RCMETER_100_PERCENT                     10000
#define RCMETER_1_PERCENT                       (RCMETER_100_PERCENT/100)

#define RCMETER_MIN_ACCOUNT_NAME_LENGTH         3
#define RCMETER_MAX_ACCOUNT_NAME_LENGTH         16

#define RCMETER_MAX_PERMLINK_LENGTH             256
#define RCMETER_MAX_WITNESS_URL_LENGTH          2048
#define RCMETER_MAX_MEMO_SIZE                   2048
#define RCMETER_COMMENT_TITLE_LIMIT             256
#define RCMETER_BENEFICIARY_LIMIT               128
#define RCMETER_MAX_VOTABLE_ASSETS              2
#define RCMETER_MAX_AUTHORITY_MEMBERSHIP        40
#define RCMETER_MAX_TRANSACTION_SIZE            (1024*64)

#define RCMETER_MIN_ACCOUNT_CREATION_FEE        1
#define RCMETER_MIN_BLOCK_SIZE_LIMIT            (RCMETER_MAX_TRANSACTION_SIZE)

// resource credits
#define RCMETER_RC_REGEN_TIME                   (60*60*24*5)
#define RCMETER_RC_BLOCKS_PER_REGEN             (RCMETER_RC_REGEN_TIME / RCMETER_BLOCK_INTERVAL)
#define RCMETER_NUM_RESOURCE_TYPES              5
