#pragma once

/*compile-time defaults; runtime overrides come from :set / :hi and ~/.mconflictrc*/

#ifndef MC_DEFAULT_LABEL_SHADE
#define MC_DEFAULT_LABEL_SHADE 60
#endif

#define MC_DEFAULT_CURRENT_BG  0x405D7Eu
#define MC_DEFAULT_INCOMING_BG 0x314753u
#define MC_DEFAULT_ANCESTOR_BG 0x68217Au

#define MC_DEFAULT_CURRENT_GROUP  "DiffText"
#define MC_DEFAULT_INCOMING_GROUP "DiffAdd"
#define MC_DEFAULT_ANCESTOR_GROUP "DiffChange"

#define MC_RC_FILE_NAME ".mconflictrc"

#ifndef MC_WRITE_CHUNK_SIZE
#define MC_WRITE_CHUNK_SIZE (64 * 1024)
#endif

/*used when the window width is unknown*/
#define MC_LABEL_FALLBACK_PAD 20
