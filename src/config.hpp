#pragma once

/*here you can choose the text storage backend*/

#define TB_BACKEND_VECTOR 1
#define TB_BACKEND_GAP    2

#ifndef TB_BACKEND
#define TB_BACKEND TB_BACKEND_GAP
#endif

#if TB_BACKEND != TB_BACKEND_VECTOR && TB_BACKEND != TB_BACKEND_GAP
#error "unknown TB_BACKEND"
#endif

/* bytes staged in memory before each write(2) when saving */
#ifndef TB_WRITE_CHUNK_SIZE
#define TB_WRITE_CHUNK_SIZE (64 * 1024)
#endif
