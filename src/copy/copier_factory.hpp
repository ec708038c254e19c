#ifndef WARMCACHE_SRC_COPY_COPIER_FACTORY_HPP_
#define WARMCACHE_SRC_COPY_COPIER_FACTORY_HPP_

#include "config/config_types.hpp"
#include "copy/i_copier.hpp"
#include "copy/native_copier.hpp"
#include "copy/rsync_copier.hpp"

#include <memory>

namespace WarmCache::Copy
{

class CopierFactory
{
    public:
    //------------------------------------------------------------------------------//
    // Class Creation and Destruction
    //------------------------------------------------------------------------------//
    CopierFactory()                                = delete;
    CopierFactory(const CopierFactory&)            = delete;
    CopierFactory& operator=(const CopierFactory&) = delete;
    CopierFactory(CopierFactory&&)                 = delete;
    CopierFactory& operator=(CopierFactory&&)      = delete;
    ~CopierFactory()                               = delete;

    //------------------------------------------------------------------------------//
    // Public Methods
    //------------------------------------------------------------------------------//

    static Storage::StorageResult<std::unique_ptr<ICopier>> Create(const Config::NodeConfig& config)
    {
        CopierSettings settings;
        settings.owner_uid = config.ownership.uid;
        settings.owner_gid = config.ownership.gid;

        switch (config.copy.method) {
            case Config::CopyMethod::Rsync:
                return std::make_unique<RsyncCopier>(
                    config.copy.rsync_path, settings, config.copy.extra_args
                );
            case Config::CopyMethod::Native:
                return std::make_unique<NativeCopier>(settings);
            default:
                return std::unexpected(Storage::make_error_code(Storage::StorageErrc::NotSupported));
        }
    }
};

}  // namespace WarmCache::Copy

#endif  // WARMCACHE_SRC_COPY_COPIER_FACTORY_HPP_
