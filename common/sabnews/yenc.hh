/*
	sabnews/yenc.hh
	---------------
*/

#ifndef SABNEWS_YENC_HH
#define SABNEWS_YENC_HH

// Standard C
#include <stdint.h>

// Standard C++
#include <cstddef>


namespace sabnews
{
	
	class send_queue;
	
	enum crc_policy
	{
		crc_empty,    // always pcrc32=00000000, as clients of the old server expect
		crc_payload,  // CRC32 of the unencoded bytes
	};
	
	struct yenc_part
	{
		const char*  name;       // file base name
		uint64_t     part;
		uint64_t     start;      // 0-based offset of the data within the file
		uint64_t     file_size;
		crc_policy   crc;
	};
	
	const unsigned yenc_line_length = 128;
	
	void queue_yenc_header( send_queue& queue, const yenc_part& part, std::size_t size );
	
	void queue_yenc_data( send_queue& queue, const char* data, std::size_t n );
	
	void queue_yenc_footer( send_queue& queue, const yenc_part& part, const char* data, std::size_t n );
	
	/*
		=ybegin, =ypart, the encoded data, =yend.
	*/
	
	void queue_yenc( send_queue& queue, const yenc_part& part, const char* data, std::size_t n );
	
}

#endif
