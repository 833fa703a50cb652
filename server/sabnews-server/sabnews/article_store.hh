/*
	sabnews/article_store.hh
	------------------------
*/

#ifndef SABNEWS_ARTICLESTORE_HH
#define SABNEWS_ARTICLESTORE_HH

// Standard C
#include <stdint.h>

// Standard C++
#include <vector>


namespace sabnews
{
	
	enum article_status
	{
		article_ok,
		article_no_file,        // nothing on disk at that path
		article_invalid_range,  // start + size runs past the end of the file
	};
	
	struct article
	{
		std::vector< char >  data;
		uint64_t             file_size;
		
		article() : file_size()
		{
		}
	};
	
	/*
		With a root set, relative paths resolve against it and any path
		that is absolute or contains a ".." component is refused as
		article_no_file.  NULL (the default) uses paths as given.
	*/
	
	void set_article_root( const char* dir );
	
	/*
		Reads exactly size bytes at offset start.  Failures other than the
		two statuses above (EACCES, EISDIR, a file that shrank, ...) are
		thrown as poseven::errno_t.
	*/
	
	article_status read_article( const char*  path,
	                             uint64_t     start,
	                             uint64_t     size,
	                             article&     result );
	
}

#endif
