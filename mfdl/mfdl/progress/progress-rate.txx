namespace mfdl
{
  template <typename C>
  basic_rate_meter<C>::
  basic_rate_meter (double s, duration i)
    : smoothing_ (s), interval_ (i)
  {
  }

  template <typename C>
  void basic_rate_meter<C>::
  sample (std::uint64_t n, time_point t)
  {
    if (!last_time_)
    {
      last_time_ = t;
      last_bytes_ = n;
      return;
    }

    duration dt (t - *last_time_);

    if (dt < interval_ || dt <= duration::zero ())
      return;

    // A counter that went backwards (the partial file was restarted) counts
    // as no progress.
    //
    double s (std::chrono::duration<double> (dt).count ());
    double r (n > last_bytes_ ? static_cast<double> (n - last_bytes_) / s
                              : 0.0);

    rate_ = measured_ ? smoothing_ * r + (1.0 - smoothing_) * rate_ : r;
    measured_ = true;

    last_time_ = t;
    last_bytes_ = n;
  }

  template <typename C>
  void basic_rate_meter<C>::
  reset () noexcept
  {
    last_time_.reset ();
    last_bytes_ = 0;
    rate_ = 0.0;
    measured_ = false;
  }
}
