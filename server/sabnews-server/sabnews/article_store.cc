/*
	sabnews/article_store.cc
	------------------------
*/

#include "sabnews/article_store.hh"

// POSIX
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>

// Standard C
#include <errno.h>
#include <string.h>

// plus
#include "plus/var_string.hh"

// poseven
#include "poseven/types/errno_t.hh"


#define STR_LEN( s )  "" s, (sizeof s - 1)


namespace sabnews
{
	
	namespace p7 = poseven;
	
	
	static const char* the_article_root;
	
	void set_article_root( const char* dir )
	{
		the_article_root = dir;
	}
	
	class fd_closer
	{
		private:
			int its_fd;
			
			// non-copyable
			fd_closer           ( const fd_closer& );
			fd_closer& operator=( const fd_closer& );
		
		public:
			explicit fd_closer( int fd ) : its_fd( fd )
			{
			}
			
			~fd_closer()
			{
				close( its_fd );
			}
	};
	
	static
	bool is_confined( const char* path )
	{
		if ( *path == '/' )
		{
			return false;
		}
		
		const char* p = path;
		
		for ( ;; )
		{
			const char* slash = strchr( p, '/' );
			
			const size_t n = slash ? slash - p : strlen( p );
			
			if ( n == 2  &&  memcmp( p, STR_LEN( ".." ) ) == 0 )
			{
				return false;
			}
			
			if ( slash == NULL )
			{
				return true;
			}
			
			p = slash + 1;
		}
	}
	
	static
	int open_article( const char* path )
	{
		if ( the_article_root == NULL )
		{
			return open( path, O_RDONLY );
		}
		
		if ( ! is_confined( path ) )
		{
			errno = ENOENT;
			
			return -1;
		}
		
		plus::var_string pathname;
		
		pathname.append( the_article_root, strlen( the_article_root ) );
		pathname.append( STR_LEN( "/" ) );
		pathname.append( path, strlen( path ) );
		
		return open( pathname.c_str(), O_RDONLY );
	}
	
	static
	void pread_in_full( int fd, char* buffer, uint64_t n, uint64_t offset )
	{
		while ( n > 0 )
		{
			const size_t chunk = n < 65536 ? size_t( n ) : 65536;
			
			ssize_t n_read = pread( fd, buffer, chunk, off_t( offset ) );
			
			if ( n_read < 0 )
			{
				if ( errno == EINTR )
				{
					continue;
				}
				
				p7::throw_errno( errno );
			}
			
			if ( n_read == 0 )
			{
				p7::throw_errno( EIO );  // truncated since we checked its size
			}
			
			buffer += n_read;
			offset += n_read;
			n      -= n_read;
		}
	}
	
	article_status read_article( const char*  path,
	                             uint64_t     start,
	                             uint64_t     size,
	                             article&     result )
	{
		const int fd = open_article( path );
		
		if ( fd < 0 )
		{
			if ( errno == ENOENT  ||  errno == ENOTDIR  ||
			     errno == ENAMETOOLONG  ||  errno == ELOOP )
			{
				return article_no_file;
			}
			
			p7::throw_errno( errno );
		}
		
		fd_closer closer( fd );
		
		struct stat sb;
		
		p7::throw_posix_result( fstat( fd, &sb ) );
		
		if ( S_ISDIR( sb.st_mode ) )
		{
			p7::throw_errno( EISDIR );
		}
		
		const uint64_t file_size = sb.st_size;
		
		if ( size > file_size  ||  start > file_size - size )
		{
			return article_invalid_range;
		}
		
		result.file_size = file_size;
		
		result.data.resize( size );
		
		if ( size > 0 )
		{
			pread_in_full( fd, &result.data[ 0 ], size, start );
		}
		
		return article_ok;
	}
	
}
