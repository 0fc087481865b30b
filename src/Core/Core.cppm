export module Core;

// Re-export all sub-systems so the user only needs 'import Core;'
export import :Error;
export import :Logging;
export import :Hash;
export import :Handle;
export import :ResourcePool;
export import :Tasks;
export import :Assets;
export import :IOBackend;
export import :Filesystem;
export import :Window;
