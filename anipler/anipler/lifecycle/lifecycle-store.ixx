namespace anipler
{
  template <typename T>
  inline const fs::path& basic_lifecycle_store<T>::
  path () const noexcept
  {
    return path_;
  }

  template <typename T>
  inline typename basic_lifecycle_store<T>::database_type&
  basic_lifecycle_store<T>::
  db () noexcept
  {
    return *db_;
  }

  template <typename T>
  inline void basic_lifecycle_store<T>::
  set_clock (clock_type c)
  {
    clock_ = std::move (c);
    last_ = 0;
  }

  template <typename T>
  inline std::int64_t basic_lifecycle_store<T>::
  now ()
  {
    std::int64_t t (clock_ ());

    if (t < last_)
      t = last_;

    last_ = t;
    return t;
  }

  template <typename T>
  inline std::vector<artifact> basic_lifecycle_store<T>::
  list_ready ()
  {
    return list (artifact_readiness::ready);
  }

  template <typename T>
  inline std::vector<artifact> basic_lifecycle_store<T>::
  list_pending ()
  {
    return list (artifact_readiness::pending);
  }

  template <typename T>
  inline std::vector<artifact> basic_lifecycle_store<T>::
  list_claimed_unreclaimed ()
  {
    return list (artifact_readiness::claimed);
  }
}
